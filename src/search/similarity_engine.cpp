#include <kbase/search/similarity_engine.h>

#include <algorithm>
#include <cmath>

namespace kbase::search {

Result<double> cosineSimilarity(std::span<const float> a, std::span<const float> b) {
    if (a.size() != b.size()) {
        return Error{ErrorCode::DimensionMismatch,
                     "vector dimensions differ: " + std::to_string(a.size()) + " vs " +
                         std::to_string(b.size())};
    }

    double dot = 0.0;
    double normA = 0.0;
    double normB = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
        normA += static_cast<double>(a[i]) * static_cast<double>(a[i]);
        normB += static_cast<double>(b[i]) * static_cast<double>(b[i]);
    }

    if (normA == 0.0 || normB == 0.0) {
        return 0.0;
    }
    return std::clamp(dot / (std::sqrt(normA) * std::sqrt(normB)), -1.0, 1.0);
}

Result<void> SimilarityEngine::verifyDimensions(
    size_t queryDim, const std::vector<knowledge::ChunkRecord>& candidates) {
    for (const auto& c : candidates) {
        if (c.vector.size() != queryDim) {
            return Error{ErrorCode::DimensionMismatch,
                         "chunk " + c.id + " has " + std::to_string(c.vector.size()) +
                             " dimensions but the query has " + std::to_string(queryDim) +
                             ": embedding model mismatch, please use the same embedding model "
                             "or recreate the knowledge base"};
        }
    }
    return {};
}

Result<std::vector<ScoredChunk>>
SimilarityEngine::score(std::span<const float> query,
                        const std::vector<knowledge::ChunkRecord>& candidates, double threshold,
                        size_t limit) {
    std::vector<ScoredChunk> scored;
    scored.reserve(candidates.size());
    for (size_t i = 0; i < candidates.size(); ++i) {
        auto sim = cosineSimilarity(query, candidates[i].vector);
        if (!sim) {
            return sim.error();
        }
        if (sim.value() < threshold) {
            continue;
        }
        scored.push_back(ScoredChunk{&candidates[i], sim.value(), i});
    }

    std::stable_sort(scored.begin(), scored.end(),
                     [](const ScoredChunk& a, const ScoredChunk& b) { return a.score > b.score; });
    if (scored.size() > limit) {
        scored.resize(limit);
    }
    return scored;
}

knowledge::SearchResult SimilarityEngine::toResult(const ScoredChunk& scored) {
    knowledge::SearchResult r;
    r.chunkId = scored.record->id;
    r.content = scored.record->content;
    r.score = scored.score;
    r.metadata = scored.record->metadata;
    return r;
}

Result<std::vector<knowledge::SearchResult>>
SimilarityEngine::search(std::span<const float> query,
                         const std::vector<knowledge::ChunkRecord>& candidates, double threshold,
                         size_t limit) {
    auto scored = score(query, candidates, threshold, limit);
    if (!scored) {
        return scored.error();
    }
    std::vector<knowledge::SearchResult> out;
    out.reserve(scored.value().size());
    for (const auto& s : scored.value()) {
        out.push_back(toResult(s));
    }
    return out;
}

} // namespace kbase::search
