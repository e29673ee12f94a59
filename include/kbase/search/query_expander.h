#pragma once

#include <kbase/core/bounded_cache.h>
#include <kbase/core/types.h>
#include <kbase/knowledge/types.h>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace kbase::search {

/**
 * Lowercased terms of text. ASCII letters and digits form terms; any byte
 * >= 0x80 is kept inside the term so CJK and accented text survive.
 */
std::vector<std::string> tokenize(std::string_view text);

std::string toLower(std::string_view text);

struct QueryExpansion {
    std::string originalQuery;
    std::vector<std::string> variants; ///< Original query first, deduplicated
    std::vector<std::string> synonyms;
    std::vector<std::string> relatedTerms;
};

using SynonymTable = std::map<std::string, std::vector<std::string>>;

SynonymTable defaultSynonymTable();

/**
 * @brief Produces alternative phrasings of a query
 */
class IQueryExpander {
public:
    virtual ~IQueryExpander() = default;

    /**
     * @param scope   Cache partition, typically the knowledge-base id
     * @param sample  Chunks related terms may be mined from
     */
    virtual Result<QueryExpansion> expand(const std::string& query, const std::string& scope,
                                          const std::vector<knowledge::ChunkRecord>& sample,
                                          size_t maxVariants) = 0;
};

/**
 * Dictionary and corpus heuristics:
 *  - decomposition on " and " and commas
 *  - first synonym of the first table word found in the query
 *  - query plus one related term mined from the sample
 *  - singular/plural swap of longer terms
 * Expansions are cached per (scope, query).
 */
class HeuristicQueryExpander final : public IQueryExpander {
public:
    static constexpr size_t kMaxRelatedTerms = 5;
    static constexpr size_t kSampleChunks = 10;

    explicit HeuristicQueryExpander(SynonymTable synonyms = defaultSynonymTable(),
                                    size_t cacheCapacity = 100);

    Result<QueryExpansion> expand(const std::string& query, const std::string& scope,
                                  const std::vector<knowledge::ChunkRecord>& sample,
                                  size_t maxVariants) override;

    void clearCache() { cache_.clear(); }

private:
    std::vector<std::string> decompose(const std::string& query) const;
    std::vector<std::string> findSynonyms(const std::string& query, std::string& matched) const;
    std::vector<std::string> relatedTerms(const std::string& query,
                                          const std::vector<knowledge::ChunkRecord>& sample) const;
    std::string inflect(const std::string& query) const;

    SynonymTable synonyms_;
    core::BoundedCache<std::string, QueryExpansion> cache_;
};

} // namespace kbase::search
