#pragma once

#include <kbase/core/types.h>
#include <kbase/knowledge/types.h>

#include <span>
#include <vector>

namespace kbase::search {

/**
 * Cosine similarity accumulated in double precision and clamped to [-1, 1].
 * Zero-magnitude input yields 0; differing lengths are a DimensionMismatch.
 */
Result<double> cosineSimilarity(std::span<const float> a, std::span<const float> b);

/**
 * A candidate paired with its similarity and its position in the input, the
 * latter used to keep ordering stable on equal scores.
 */
struct ScoredChunk {
    const knowledge::ChunkRecord* record = nullptr;
    double score = 0.0;
    size_t ordinal = 0;
};

class SimilarityEngine {
public:
    /**
     * Scores every candidate against query, drops those below threshold and
     * returns the rest best-first, truncated to limit.
     */
    static Result<std::vector<ScoredChunk>>
    score(std::span<const float> query, const std::vector<knowledge::ChunkRecord>& candidates,
          double threshold, size_t limit);

    static Result<std::vector<knowledge::SearchResult>>
    search(std::span<const float> query, const std::vector<knowledge::ChunkRecord>& candidates,
           double threshold, size_t limit);

    /// Confirms every candidate vector has the query's width
    static Result<void> verifyDimensions(size_t queryDim,
                                         const std::vector<knowledge::ChunkRecord>& candidates);

    static knowledge::SearchResult toResult(const ScoredChunk& scored);
};

} // namespace kbase::search
