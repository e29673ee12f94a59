#include <kbase/search/enhanced_retrieval.h>
#include <kbase/search/similarity_engine.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace kbase::search {

using knowledge::ChunkRecord;
using knowledge::SearchResult;

namespace {

// Runs an optional stage; exceptions and errors become PipelineStageFailure.
template <typename T, typename Fn> Result<T> guardStage(const char* stage, Fn&& fn) {
    try {
        Result<T> r = fn();
        if (!r) {
            spdlog::warn("Retrieval stage '{}' failed, keeping previous results: {}", stage,
                         r.error().message);
            return Error{ErrorCode::PipelineStageFailure,
                         std::string(stage) + ": " + r.error().message};
        }
        return r;
    } catch (const std::exception& e) {
        spdlog::warn("Retrieval stage '{}' threw, keeping previous results: {}", stage, e.what());
        return Error{ErrorCode::PipelineStageFailure, std::string(stage) + ": " + e.what()};
    }
}

} // namespace

Result<void> RetrievalConfig::validate() const {
    if (maxCandidates == 0) {
        return Error{ErrorCode::InvalidConfig, "maxCandidates must be greater than zero"};
    }
    if (diversityThreshold < -1.0 || diversityThreshold > 1.0) {
        return Error{ErrorCode::InvalidConfig, "diversityThreshold must lie in [-1, 1]"};
    }
    return {};
}

double termOverlapRatio(const std::vector<std::string>& queryTerms,
                        const std::vector<std::string>& chunkTerms) {
    if (queryTerms.empty())
        return 0.0;
    std::unordered_set<std::string> chunkSet(chunkTerms.begin(), chunkTerms.end());
    std::unordered_set<std::string> uniqueQuery(queryTerms.begin(), queryTerms.end());
    size_t matched = 0;
    for (const auto& t : uniqueQuery) {
        if (chunkSet.count(t))
            ++matched;
    }
    return static_cast<double>(matched) / static_cast<double>(uniqueQuery.size());
}

EnhancedRetrievalPipeline::EnhancedRetrievalPipeline(std::shared_ptr<IQueryExpander> expander)
    : expander_(expander ? std::move(expander) : std::make_shared<HeuristicQueryExpander>()) {}

void EnhancedRetrievalPipeline::sortCandidates(std::vector<Candidate>& candidates) {
    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        if (a.score != b.score)
            return a.score > b.score;
        return a.ordinal < b.ordinal;
    });
}

Result<std::vector<EnhancedRetrievalPipeline::Variant>>
EnhancedRetrievalPipeline::expandStage(const RetrievalRequest& request,
                                       const RetrievalConfig& config) {
    std::vector<Variant> variants;
    variants.push_back({request.query, request.queryVector});

    auto expansion = expander_->expand(request.query, request.scope, *request.candidates,
                                       config.maxQueryVariants);
    if (!expansion) {
        return expansion.error();
    }
    if (!request.embedVariant) {
        return variants;
    }

    for (const auto& text : expansion.value().variants) {
        if (text == request.query)
            continue;
        auto vec = request.embedVariant(text);
        if (!vec) {
            spdlog::debug("Skipping query variant '{}': {}", text, vec.error().message);
            continue;
        }
        if (vec.value().size() != request.queryVector.size()) {
            spdlog::debug("Skipping query variant '{}': width {} != {}", text,
                          vec.value().size(), request.queryVector.size());
            continue;
        }
        variants.push_back({text, std::move(vec).value()});
    }
    return variants;
}

Result<std::vector<double>>
EnhancedRetrievalPipeline::lexicalStage(const std::string& variantText,
                                        const std::vector<const ChunkRecord*>& pool) {
    auto queryTerms = tokenize(variantText);
    std::vector<double> scores;
    scores.reserve(pool.size());
    for (const auto* record : pool) {
        scores.push_back(termOverlapRatio(queryTerms, tokenize(record->content)));
    }
    return scores;
}

Result<std::vector<EnhancedRetrievalPipeline::Candidate>>
EnhancedRetrievalPipeline::candidateStage(const RetrievalRequest& request,
                                          const std::vector<Variant>& variants, bool hybrid,
                                          size_t poolLimit) {
    std::unordered_map<std::string, Candidate> best;
    const bool lexicalAvailable = hybrid;

    for (const auto& variant : variants) {
        auto scored =
            SimilarityEngine::score(variant.vector, *request.candidates, request.threshold,
                                    poolLimit);
        if (!scored) {
            return scored.error();
        }

        std::vector<double> lexical;
        if (lexicalAvailable) {
            std::vector<const ChunkRecord*> pool;
            pool.reserve(scored.value().size());
            for (const auto& s : scored.value())
                pool.push_back(s.record);
            auto r = guardStage<std::vector<double>>(
                "hybrid-lexical", [&] { return lexicalStage(variant.text, pool); });
            if (r && r.value().size() == pool.size()) {
                lexical = std::move(r).value();
            } else {
                // Without lexical scores for every variant the blend is not comparable
                return candidateStage(request, variants, false, poolLimit);
            }
        }

        for (size_t i = 0; i < scored.value().size(); ++i) {
            const auto& s = scored.value()[i];
            Candidate c;
            c.record = s.record;
            c.vectorScore = s.score;
            c.ordinal = s.ordinal;
            if (lexicalAvailable) {
                c.lexicalScore = lexical[i];
                c.score = HybridWeights::kVector * s.score + HybridWeights::kLexical * lexical[i];
            } else {
                c.score = s.score;
            }
            auto [it, inserted] = best.emplace(s.record->id, c);
            if (!inserted && c.score > it->second.score) {
                it->second = c;
            }
        }
    }

    std::vector<Candidate> out;
    out.reserve(best.size());
    for (auto& [_, c] : best) {
        out.push_back(c);
    }
    sortCandidates(out);
    return out;
}

Result<std::vector<EnhancedRetrievalPipeline::Candidate>>
EnhancedRetrievalPipeline::diversityStage(std::vector<Candidate> ranked, double threshold) {
    std::vector<Candidate> accepted;
    for (auto& candidate : ranked) {
        bool distinct = true;
        for (const auto& kept : accepted) {
            auto sim = cosineSimilarity(candidate.record->vector, kept.record->vector);
            if (!sim) {
                return sim.error();
            }
            if (sim.value() >= threshold) {
                distinct = false;
                break;
            }
        }
        if (distinct) {
            accepted.push_back(candidate);
        }
    }
    spdlog::debug("Diversity filter kept {} of {} candidates", accepted.size(), ranked.size());
    return accepted;
}

Result<std::vector<EnhancedRetrievalPipeline::Candidate>>
EnhancedRetrievalPipeline::rerankStage(std::vector<Candidate> ranked, const std::string& query) {
    auto queryTerms = tokenize(query);
    auto phrase = toLower(query);
    auto start = phrase.find_first_not_of(" \t\r\n");
    phrase = start == std::string::npos
                 ? std::string{}
                 : phrase.substr(start, phrase.find_last_not_of(" \t\r\n") - start + 1);

    for (auto& c : ranked) {
        auto content = toLower(c.record->content);
        double relevance = 0.0;
        if (!phrase.empty() && content.find(phrase) != std::string::npos) {
            relevance = 1.0;
        } else if (!queryTerms.empty()) {
            size_t matched = 0;
            for (const auto& term : queryTerms) {
                if (content.find(term) != std::string::npos)
                    ++matched;
            }
            relevance = static_cast<double>(matched) / static_cast<double>(queryTerms.size());
        }
        c.score = RerankWeights::kPrior * c.score + RerankWeights::kRelevance * relevance;
    }
    // Stable on the incoming order for equal scores
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const Candidate& a, const Candidate& b) { return a.score > b.score; });
    return ranked;
}

Result<std::vector<SearchResult>> EnhancedRetrievalPipeline::run(const RetrievalRequest& request,
                                                                 const RetrievalConfig& config) {
    if (!request.candidates) {
        return Error{ErrorCode::InvalidArgument, "retrieval request has no candidate set"};
    }
    if (auto valid = config.validate(); !valid) {
        return valid.error();
    }
    if (auto dims = SimilarityEngine::verifyDimensions(request.queryVector.size(),
                                                       *request.candidates);
        !dims) {
        return dims.error();
    }

    std::vector<Variant> variants{{request.query, request.queryVector}};
    if (config.enableQueryExpansion) {
        auto expanded = guardStage<std::vector<Variant>>(
            "query-expansion", [&] { return expandStage(request, config); });
        if (expanded) {
            variants = std::move(expanded).value();
        }
    }

    const size_t poolLimit = std::max(config.maxCandidates, request.limit);
    auto candidates = candidateStage(request, variants, config.enableHybridSearch, poolLimit);
    if (!candidates) {
        return candidates.error();
    }
    auto ranked = std::move(candidates).value();

    if (config.enableDiversityFilter) {
        auto diverse = guardStage<std::vector<Candidate>>(
            "diversity", [&] { return diversityStage(ranked, config.diversityThreshold); });
        if (diverse) {
            ranked = std::move(diverse).value();
        }
    }

    if (config.enableRerank) {
        auto reranked = guardStage<std::vector<Candidate>>(
            "rerank", [&] { return rerankStage(ranked, request.query); });
        if (reranked) {
            ranked = std::move(reranked).value();
        }
    }

    if (ranked.size() > request.limit) {
        ranked.resize(request.limit);
    }

    std::vector<SearchResult> out;
    out.reserve(ranked.size());
    for (const auto& c : ranked) {
        SearchResult r;
        r.chunkId = c.record->id;
        r.content = c.record->content;
        r.score = c.score;
        r.metadata = c.record->metadata;
        out.push_back(std::move(r));
    }
    spdlog::debug("Enhanced retrieval returned {} results from {} variants", out.size(),
                  variants.size());
    return out;
}

} // namespace kbase::search
