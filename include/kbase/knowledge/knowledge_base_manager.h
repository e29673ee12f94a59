#pragma once

#include <kbase/core/types.h>
#include <kbase/knowledge/events.h>
#include <kbase/knowledge/types.h>
#include <kbase/search/enhanced_retrieval.h>
#include <kbase/storage/knowledge_base_repository.h>
#include <kbase/storage/vector_store.h>
#include <kbase/vector/embedding_provider.h>
#include <kbase/vector/model_descriptor.h>

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace kbase::knowledge {

struct SearchRequest {
    std::string knowledgeBaseId;
    std::string query;
    std::optional<double> threshold; ///< Defaults to the base's threshold
    std::optional<size_t> limit;     ///< Defaults to the base's documentCount
    std::optional<bool> useEnhanced; ///< Enhanced unless explicitly false
};

struct EnhancedSearchRequest {
    std::string knowledgeBaseId;
    std::string query;
    std::optional<double> threshold;
    std::optional<size_t> limit;
    std::optional<search::RetrievalConfig> config; ///< Defaults to the manager's config
};

/// Produces the stand-in vector for a chunk whose embedding failed
using FallbackVectorGenerator = std::function<Embedding(size_t dimensions)>;

struct ManagerOptions {
    KnowledgeBaseDefaults defaults;
    search::RetrievalConfig retrieval;
    FallbackVectorGenerator fallbackVector; ///< Uniform in [-1, 1] when unset
};

/**
 * @brief Knowledge-base CRUD, document ingestion and search dispatch
 *
 * Collaborators are injected; the manager owns no global state. Every
 * operation is synchronous and reports failures through Result.
 */
class KnowledgeBaseManager {
public:
    KnowledgeBaseManager(std::shared_ptr<storage::IKnowledgeBaseRepository> repository,
                         std::shared_ptr<storage::IVectorStore> store,
                         std::shared_ptr<vector::EmbeddingProvider> embeddings,
                         std::shared_ptr<vector::IModelCatalog> models,
                         std::shared_ptr<KnowledgeEventListener> events = nullptr,
                         ManagerOptions options = {},
                         std::shared_ptr<search::EnhancedRetrievalPipeline> pipeline = nullptr);

    // ===== Knowledge bases =====

    Result<KnowledgeBase> createKnowledgeBase(const KnowledgeBaseDraft& draft);
    Result<KnowledgeBase> getKnowledgeBase(const std::string& id);
    Result<std::vector<KnowledgeBase>> listKnowledgeBases();

    /**
     * Applies the set fields of patch. Changing the model or the dimensions of
     * a base that already holds chunks is a DimensionMismatch.
     */
    Result<KnowledgeBase> updateKnowledgeBase(const std::string& id,
                                              const KnowledgeBasePatch& patch);

    /// Removes the base and all its chunks; returns the number of chunks removed
    Result<size_t> deleteKnowledgeBase(const std::string& id);

    // ===== Documents =====

    /**
     * Chunks content, embeds each chunk in order and persists it. A chunk whose
     * embedding fails is stored with a fallback vector and flagged degraded.
     */
    Result<std::vector<ChunkRecord>> addDocument(const std::string& knowledgeBaseId,
                                                 const std::string& content,
                                                 const SourceMetadata& source);

    Result<std::vector<ChunkRecord>> listDocuments(const std::string& knowledgeBaseId);

    /// false (with a warning) when the chunk does not exist
    Result<bool> deleteDocument(const std::string& chunkId);

    Result<std::vector<ChunkRecord>> listDegradedChunks(const std::string& knowledgeBaseId);

    /// Re-embeds degraded chunks; returns how many now carry a real embedding
    Result<size_t> reembedDegradedChunks(const std::string& knowledgeBaseId);

    // ===== Search =====

    Result<std::vector<SearchResult>> search(const SearchRequest& request);
    Result<std::vector<SearchResult>> enhancedSearch(const EnhancedSearchRequest& request);

    const ManagerOptions& options() const { return options_; }

private:
    Result<KnowledgeBase> loadBase(const std::string& id);
    std::optional<vector::ModelDescriptor> resolveModel(const std::string& modelId) const;
    Result<Embedding> embedFor(const KnowledgeBase& base, const std::string& text);
    Embedding fallbackVector(size_t dimensions);
    Result<void> validateSettings(const KnowledgeBase& base) const;

    Result<std::vector<SearchResult>>
    runSearch(const std::string& knowledgeBaseId, const std::string& query,
              std::optional<double> threshold, std::optional<size_t> limit,
              std::optional<search::RetrievalConfig> enhanced);

    std::shared_ptr<storage::IKnowledgeBaseRepository> repository_;
    std::shared_ptr<storage::IVectorStore> store_;
    std::shared_ptr<vector::EmbeddingProvider> embeddings_;
    std::shared_ptr<vector::IModelCatalog> models_;
    std::shared_ptr<KnowledgeEventListener> events_;
    ManagerOptions options_;
    std::shared_ptr<search::EnhancedRetrievalPipeline> pipeline_;

    std::mutex rngMutex_;
    std::mt19937 rng_{std::random_device{}()};
};

} // namespace kbase::knowledge
