#pragma once

#include <kbase/core/types.h>
#include <kbase/knowledge/types.h>
#include <kbase/search/enhanced_retrieval.h>
#include <kbase/vector/embedding_provider.h>
#include <kbase/vector/model_descriptor.h>

#include <filesystem>
#include <string>
#include <vector>

namespace kbase::config {

/**
 * @brief Everything the composition root needs, with built-in defaults
 *
 * File layout (config.toml):
 *   [core]       data_dir, log_level
 *   [embedding]  cache_capacity, cache_policy, request_timeout_ms, native_providers
 *   [knowledge]  document_count, chunk_size, chunk_overlap, threshold
 *   [retrieval]  query_expansion, hybrid_search, diversity_filter, rerank,
 *                max_candidates, diversity_threshold, max_query_variants
 *   [models.<id>] provider, api_key | api_key_env, base_url, dimensions
 */
struct KbaseConfig {
    std::filesystem::path configPath;
    std::filesystem::path dataDir;
    std::string logLevel = "info";
    vector::EmbeddingProviderConfig embedding;
    knowledge::KnowledgeBaseDefaults knowledge;
    search::RetrievalConfig retrieval;
    std::vector<vector::ModelDescriptor> models;

    std::filesystem::path databasePath() const { return dataDir / "kbase.db"; }
};

/**
 * Reads configPath. A missing file yields defaults; a present but malformed
 * value is InvalidConfig naming the section and key.
 */
Result<KbaseConfig> loadConfig(const std::filesystem::path& configPath);

/// KBASE_DATA_DIR and KBASE_LOG_LEVEL override the file
void applyEnvironmentOverrides(KbaseConfig& config);

} // namespace kbase::config
