#pragma once

#include <kbase/core/bounded_cache.h>
#include <kbase/core/types.h>
#include <kbase/knowledge/knowledge_base_manager.h>

#include <memory>
#include <string>
#include <vector>

namespace kbase::knowledge {

struct KnowledgeReference {
    size_t id = 0; ///< 1-based, assigned in the order bases were searched
    std::string content;
    std::string sourceUrl; ///< knowledge://<baseId>/<chunkId>
    double similarity = 0.0;
    std::string knowledgeBaseId;
    std::string knowledgeBaseName;
};

struct ReferenceOptions {
    size_t limit = 5;
    double threshold = 0.7;
};

/**
 * Gathers references for a chat message across several knowledge bases.
 */
class KnowledgeContextService {
public:
    explicit KnowledgeContextService(std::shared_ptr<KnowledgeBaseManager> manager,
                                     size_t cacheCapacity = 100);

    /**
     * Searches every base, merges the hits best-first and keeps the top
     * options.limit. A base whose search fails is logged and skipped.
     */
    Result<std::vector<KnowledgeReference>>
    collectReferences(const std::string& messageId, const std::string& query,
                      const std::vector<std::string>& knowledgeBaseIds,
                      const ReferenceOptions& options = {});

    std::vector<KnowledgeReference> cachedReferences(const std::string& messageId);
    void clearCache(const std::string& messageId);

    static std::string sourceUrlFor(const std::string& baseId, const std::string& chunkId);

    /// Pretty-printed JSON array; empty string when there are no references
    static std::string formatReferencesJson(const std::vector<KnowledgeReference>& references);

    /// Plain-text block grouped by knowledge base
    static std::string formatReferencesContext(const std::vector<KnowledgeReference>& references);

private:
    std::shared_ptr<KnowledgeBaseManager> manager_;
    core::BoundedCache<std::string, std::vector<KnowledgeReference>> cache_;
};

} // namespace kbase::knowledge
