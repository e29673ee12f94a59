#pragma once

#include <kbase/core/types.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace kbase::knowledge {

/**
 * @brief Defaults applied to fields omitted at knowledge-base creation
 */
struct KnowledgeBaseDefaults {
    size_t documentCount = 5;
    size_t chunkSize = 1000;
    size_t chunkOverlap = 200;
    double threshold = 0.7;
};

/**
 * @brief A named collection of chunk records sharing one embedding model
 */
struct KnowledgeBase {
    std::string id;
    std::string name;
    std::optional<std::string> description;
    std::string model;     ///< Embedding model identifier
    size_t dimensions = 0; ///< Vector width every chunk of this base carries
    size_t documentCount = 5;
    size_t chunkSize = 1000;
    size_t chunkOverlap = 200;
    double threshold = 0.7;
    TimePoint createdAt;
    TimePoint updatedAt;
};

/**
 * @brief Fields accepted at creation; unset fields take configured defaults
 */
struct KnowledgeBaseDraft {
    std::string name;
    std::optional<std::string> description;
    std::string model;
    std::optional<size_t> dimensions; ///< Probed from the model when unset
    std::optional<size_t> documentCount;
    std::optional<size_t> chunkSize;
    std::optional<size_t> chunkOverlap;
    std::optional<double> threshold;
};

/**
 * @brief Partial update; only set fields are applied
 */
struct KnowledgeBasePatch {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<std::string> model;
    std::optional<size_t> dimensions;
    std::optional<size_t> documentCount;
    std::optional<size_t> chunkSize;
    std::optional<size_t> chunkOverlap;
    std::optional<double> threshold;
};

/**
 * @brief Where an ingested document came from
 */
struct SourceMetadata {
    std::string source;
    std::optional<std::string> fileName;
    std::optional<std::string> fileId;
};

struct ChunkMetadata {
    std::string source;
    std::optional<std::string> fileName;
    std::optional<std::string> fileId;
    size_t chunkIndex = 0;
    TimePoint createdAt;
    bool degraded = false; ///< Vector is a random fallback, not a model embedding
};

/**
 * @brief One persisted chunk of an ingested document
 */
struct ChunkRecord {
    std::string id;
    std::string knowledgeBaseId;
    std::string content;
    Embedding vector;
    ChunkMetadata metadata;
};

struct SearchResult {
    std::string chunkId;
    std::string content;
    double score = 0.0;
    ChunkMetadata metadata;
};

} // namespace kbase::knowledge
