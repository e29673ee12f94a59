#pragma once

#include <kbase/core/types.h>
#include <kbase/knowledge/types.h>
#include <kbase/search/query_expander.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace kbase::search {

/**
 * @brief Toggles and bounds for the enhanced pipeline
 */
struct RetrievalConfig {
    bool enableQueryExpansion = true;
    bool enableHybridSearch = true;
    bool enableDiversityFilter = true;
    bool enableRerank = true;
    size_t maxCandidates = 50;       ///< Pool size per query variant
    double diversityThreshold = 0.8; ///< Max pairwise cosine among kept results
    size_t maxQueryVariants = 4;     ///< Including the original query

    Result<void> validate() const;
};

/// Blend of vector similarity and lexical term overlap
struct HybridWeights {
    static constexpr double kVector = 0.7;
    static constexpr double kLexical = 0.3;
};

/// Rerank blend of the incoming score and query-term relevance
struct RerankWeights {
    static constexpr double kPrior = 0.7;
    static constexpr double kRelevance = 0.3;
};

using VariantEmbedder = std::function<Result<Embedding>(const std::string&)>;

struct RetrievalRequest {
    std::string query;
    std::string scope; ///< Knowledge-base id
    Embedding queryVector;
    const std::vector<knowledge::ChunkRecord>* candidates = nullptr;
    double threshold = 0.0;
    size_t limit = 5;
    VariantEmbedder embedVariant; ///< Used for expanded variants only
};

/**
 * Fraction of query terms present in the chunk terms, in [0, 1].
 */
double termOverlapRatio(const std::vector<std::string>& queryTerms,
                        const std::vector<std::string>& chunkTerms);

/**
 * @brief Query expansion, hybrid scoring, diversity filtering and rerank
 *
 * Optional stages that fail are logged and skipped, keeping the previous
 * stage's output. With every optional stage disabled or failing the result
 * equals SimilarityEngine::search over the same inputs. DimensionMismatch in
 * the vector stage is never recovered.
 */
class EnhancedRetrievalPipeline {
public:
    explicit EnhancedRetrievalPipeline(std::shared_ptr<IQueryExpander> expander = nullptr);
    virtual ~EnhancedRetrievalPipeline() = default;

    Result<std::vector<knowledge::SearchResult>> run(const RetrievalRequest& request,
                                                     const RetrievalConfig& config);

protected:
    struct Variant {
        std::string text;
        Embedding vector;
    };

    struct Candidate {
        const knowledge::ChunkRecord* record = nullptr;
        double vectorScore = 0.0;
        double lexicalScore = 0.0;
        double score = 0.0; ///< Score the next stage ranks by
        size_t ordinal = 0; ///< Position among the request's candidates
    };

    virtual Result<std::vector<Variant>> expandStage(const RetrievalRequest& request,
                                                     const RetrievalConfig& config);
    virtual Result<std::vector<double>>
    lexicalStage(const std::string& variantText,
                 const std::vector<const knowledge::ChunkRecord*>& pool);
    virtual Result<std::vector<Candidate>> diversityStage(std::vector<Candidate> ranked,
                                                          double threshold);
    virtual Result<std::vector<Candidate>> rerankStage(std::vector<Candidate> ranked,
                                                       const std::string& query);

    static void sortCandidates(std::vector<Candidate>& candidates);

private:
    Result<std::vector<Candidate>> candidateStage(const RetrievalRequest& request,
                                                  const std::vector<Variant>& variants,
                                                  bool hybrid, size_t poolLimit);

    std::shared_ptr<IQueryExpander> expander_;
};

} // namespace kbase::search
