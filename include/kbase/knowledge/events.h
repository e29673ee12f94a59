#pragma once

#include <kbase/knowledge/types.h>

#include <cstddef>
#include <string>

namespace kbase::knowledge {

struct ChunkProcessedEvent {
    std::string chunkId;
    std::string knowledgeBaseId;
    size_t current = 0; ///< 1-based
    size_t total = 0;
};

struct EmbeddingDegradedEvent {
    std::string knowledgeBaseId;
    std::string chunkId;
    size_t chunkIndex = 0;
    std::string reason;
};

/**
 * @brief Observer for knowledge-base lifecycle and ingestion progress
 *
 * All callbacks have empty defaults so listeners override only what they
 * need. Callbacks run synchronously on the calling thread.
 */
class KnowledgeEventListener {
public:
    virtual ~KnowledgeEventListener() = default;

    virtual void onKnowledgeBaseCreated(const KnowledgeBase&) {}
    virtual void onKnowledgeBaseUpdated(const KnowledgeBase&) {}
    virtual void onKnowledgeBaseDeleted(const std::string& /*baseId*/,
                                        size_t /*documentCountRemoved*/) {}
    virtual void onChunkProcessed(const ChunkProcessedEvent&) {}
    virtual void onDocumentsAdded(const std::string& /*baseId*/, size_t /*count*/) {}
    virtual void onDocumentDeleted(const std::string& /*chunkId*/, const std::string& /*baseId*/) {}
    virtual void onEmbeddingDegraded(const EmbeddingDegradedEvent&) {}
};

/**
 * Writes every event to the spdlog default logger.
 */
class LoggingEventListener final : public KnowledgeEventListener {
public:
    void onKnowledgeBaseCreated(const KnowledgeBase& base) override;
    void onKnowledgeBaseUpdated(const KnowledgeBase& base) override;
    void onKnowledgeBaseDeleted(const std::string& baseId, size_t removed) override;
    void onChunkProcessed(const ChunkProcessedEvent& event) override;
    void onDocumentsAdded(const std::string& baseId, size_t count) override;
    void onDocumentDeleted(const std::string& chunkId, const std::string& baseId) override;
    void onEmbeddingDegraded(const EmbeddingDegradedEvent& event) override;
};

} // namespace kbase::knowledge
