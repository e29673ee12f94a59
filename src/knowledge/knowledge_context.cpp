#include <kbase/knowledge/knowledge_context.h>

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>

namespace kbase::knowledge {

KnowledgeContextService::KnowledgeContextService(std::shared_ptr<KnowledgeBaseManager> manager,
                                                 size_t cacheCapacity)
    : manager_(std::move(manager)), cache_(cacheCapacity) {}

std::string KnowledgeContextService::sourceUrlFor(const std::string& baseId,
                                                  const std::string& chunkId) {
    return "knowledge://" + baseId + "/" + chunkId;
}

Result<std::vector<KnowledgeReference>> KnowledgeContextService::collectReferences(
    const std::string& messageId, const std::string& query,
    const std::vector<std::string>& knowledgeBaseIds, const ReferenceOptions& options) {
    if (options.limit == 0) {
        return Error{ErrorCode::InvalidArgument, "reference limit must be greater than zero"};
    }

    std::vector<KnowledgeReference> references;
    size_t nextId = 1;

    for (const auto& baseId : knowledgeBaseIds) {
        auto base = manager_->getKnowledgeBase(baseId);
        if (!base) {
            spdlog::error("Skipping knowledge base {}: {}", baseId, base.error().message);
            continue;
        }

        SearchRequest request;
        request.knowledgeBaseId = baseId;
        request.query = query;
        request.threshold = options.threshold;
        request.limit = options.limit;
        auto results = manager_->search(request);
        if (!results) {
            spdlog::error("Search in knowledge base {} failed: {}", baseId,
                          results.error().message);
            continue;
        }

        for (const auto& r : results.value()) {
            KnowledgeReference ref;
            ref.id = nextId++;
            ref.content = r.content;
            ref.sourceUrl = sourceUrlFor(baseId, r.chunkId);
            ref.similarity = r.score;
            ref.knowledgeBaseId = baseId;
            ref.knowledgeBaseName = base.value().name;
            references.push_back(std::move(ref));
        }
    }

    std::stable_sort(references.begin(), references.end(),
                     [](const KnowledgeReference& a, const KnowledgeReference& b) {
                         return a.similarity > b.similarity;
                     });
    if (references.size() > options.limit) {
        references.resize(options.limit);
    }

    cache_.erase(messageId);
    cache_.put(messageId, references);
    spdlog::debug("Collected {} knowledge references for message {}", references.size(),
                  messageId);
    return references;
}

std::vector<KnowledgeReference>
KnowledgeContextService::cachedReferences(const std::string& messageId) {
    return cache_.get(messageId).value_or(std::vector<KnowledgeReference>{});
}

void KnowledgeContextService::clearCache(const std::string& messageId) {
    cache_.erase(messageId);
}

std::string
KnowledgeContextService::formatReferencesJson(const std::vector<KnowledgeReference>& references) {
    if (references.empty()) {
        return {};
    }
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& ref : references) {
        arr.push_back({{"id", ref.id},
                       {"content", ref.content},
                       {"sourceUrl", ref.sourceUrl},
                       {"type", "file"},
                       {"similarity", ref.similarity},
                       {"knowledgeBaseId", ref.knowledgeBaseId},
                       {"knowledgeBaseName", ref.knowledgeBaseName}});
    }
    return arr.dump(2);
}

std::string
KnowledgeContextService::formatReferencesContext(const std::vector<KnowledgeReference>& references) {
    if (references.empty()) {
        return {};
    }

    // Group by base name, keeping first-seen order of bases
    std::vector<std::string> order;
    std::map<std::string, std::vector<const KnowledgeReference*>> grouped;
    for (const auto& ref : references) {
        auto& bucket = grouped[ref.knowledgeBaseName];
        if (bucket.empty())
            order.push_back(ref.knowledgeBaseName);
        bucket.push_back(&ref);
    }

    std::string text = "\n\n--- Knowledge base references ---\n";
    for (const auto& name : order) {
        text += "\n[" + name + "]:\n";
        size_t n = 1;
        for (const auto* ref : grouped[name]) {
            text += fmt::format("{}. {} (similarity: {:.1f}%)\n", n++, ref->content,
                                ref->similarity * 100.0);
        }
    }
    text += "\n--- Answer using the references above ---\n";
    return text;
}

} // namespace kbase::knowledge
