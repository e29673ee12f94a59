// Query tokenization and heuristic expansion
#include <gtest/gtest.h>
#include <kbase/search/query_expander.h>

#include <algorithm>

namespace kbase::search {

using knowledge::ChunkRecord;

namespace {

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

std::vector<ChunkRecord> sampleOf(std::initializer_list<std::string> contents) {
    std::vector<ChunkRecord> out;
    for (const auto& c : contents) {
        ChunkRecord r;
        r.id = "c" + std::to_string(out.size());
        r.content = c;
        out.push_back(std::move(r));
    }
    return out;
}

} // namespace

TEST(TokenizeTest, LowercasesAndSplitsOnPunctuation) {
    auto terms = tokenize("Vector-DB, Search!  v2");
    ASSERT_EQ(terms.size(), 4u);
    EXPECT_EQ(terms[0], "vector");
    EXPECT_EQ(terms[1], "db");
    EXPECT_EQ(terms[2], "search");
    EXPECT_EQ(terms[3], "v2");
}

TEST(TokenizeTest, KeepsNonAsciiInsideTerms) {
    auto terms = tokenize("caf\xC3\xA9 au lait");
    ASSERT_EQ(terms.size(), 3u);
    EXPECT_EQ(terms[0], "caf\xC3\xA9");
}

TEST(HeuristicQueryExpanderTest, OriginalQueryComesFirst) {
    HeuristicQueryExpander expander;
    auto r = expander.expand("plain words here", "kb", {}, 4);
    ASSERT_TRUE(r);
    ASSERT_FALSE(r.value().variants.empty());
    EXPECT_EQ(r.value().variants.front(), "plain words here");
    EXPECT_EQ(r.value().originalQuery, "plain words here");
}

TEST(HeuristicQueryExpanderTest, DecomposesConjunctionsAndCommas) {
    HeuristicQueryExpander expander(SynonymTable{});
    auto r = expander.expand("indexing and ranking", "kb", {}, 10);
    ASSERT_TRUE(r);
    EXPECT_TRUE(contains(r.value().variants, "indexing"));
    EXPECT_TRUE(contains(r.value().variants, "ranking"));

    auto commas = expander.expand("alpha, beta\xEF\xBC\x8Cgamma", "kb", {}, 10);
    ASSERT_TRUE(commas);
    EXPECT_TRUE(contains(commas.value().variants, "alpha"));
    EXPECT_TRUE(contains(commas.value().variants, "beta"));
    EXPECT_TRUE(contains(commas.value().variants, "gamma"));

    // "缓存 和 索引": cache and index joined by the Chinese conjunction
    auto cjk = expander.expand("\xE7\xBC\x93\xE5\xAD\x98 \xE5\x92\x8C \xE7\xB4\xA2\xE5\xBC\x95",
                               "kb", {}, 10);
    ASSERT_TRUE(cjk);
    EXPECT_TRUE(contains(cjk.value().variants, "\xE7\xBC\x93\xE5\xAD\x98"));
    EXPECT_TRUE(contains(cjk.value().variants, "\xE7\xB4\xA2\xE5\xBC\x95"));
}

TEST(HeuristicQueryExpanderTest, SubstitutesFirstSynonym) {
    HeuristicQueryExpander expander;
    auto r = expander.expand("fix this error", "kb", {}, 10);
    ASSERT_TRUE(r);
    EXPECT_TRUE(contains(r.value().synonyms, "failure"));
    EXPECT_TRUE(contains(r.value().variants, "fix this failure"));
}

TEST(HeuristicQueryExpanderTest, MatchesCjkSynonymsWithoutSeparators) {
    HeuristicQueryExpander expander;
    auto r = expander.expand("\xE5\xA6\x82\xE4\xBD\x95\xE6\x90\x9C\xE7\xB4\xA2", "kb", {}, 10);
    ASSERT_TRUE(r);
    EXPECT_FALSE(r.value().synonyms.empty());
    EXPECT_GE(r.value().variants.size(), 2u);
}

TEST(HeuristicQueryExpanderTest, MinesRelatedTermsFromSample) {
    HeuristicQueryExpander expander(SynonymTable{});
    auto sample = sampleOf({"Embeddings power semantic retrieval", "nothing relevant"});
    auto r = expander.expand("embedding", "kb", sample, 10);
    ASSERT_TRUE(r);
    ASSERT_FALSE(r.value().relatedTerms.empty());
    EXPECT_EQ(r.value().relatedTerms.front(), "embeddings");
    EXPECT_TRUE(contains(r.value().variants, "embedding embeddings"));
}

TEST(HeuristicQueryExpanderTest, SwapsSingularAndPlural) {
    HeuristicQueryExpander expander(SynonymTable{});
    auto r = expander.expand("vectors", "kb", {}, 10);
    ASSERT_TRUE(r);
    EXPECT_TRUE(contains(r.value().variants, "vector"));
}

TEST(HeuristicQueryExpanderTest, InflectsWholeTermsOnly) {
    HeuristicQueryExpander expander(SynonymTable{});
    auto r = expander.expand("database data", "kb", {}, 10);
    ASSERT_TRUE(r);
    EXPECT_TRUE(contains(r.value().variants, "databases datas"));
    EXPECT_FALSE(contains(r.value().variants, "datasbases data"));
}

TEST(HeuristicQueryExpanderTest, SynonymSubstitutionSkipsLongerWords) {
    SynonymTable table{{"error", {"fault"}}};
    HeuristicQueryExpander expander(table);
    auto r = expander.expand("errorlog error", "kb", {}, 10);
    ASSERT_TRUE(r);
    EXPECT_TRUE(contains(r.value().variants, "errorlog fault"));
}

TEST(HeuristicQueryExpanderTest, HonoursMaxVariantsIncludingCachedResults) {
    HeuristicQueryExpander expander;
    auto full = expander.expand("solve problems and errors", "kb", {}, 10);
    ASSERT_TRUE(full);
    ASSERT_GT(full.value().variants.size(), 2u);

    auto capped = expander.expand("solve problems and errors", "kb", {}, 2);
    ASSERT_TRUE(capped);
    EXPECT_EQ(capped.value().variants.size(), 2u);
    EXPECT_EQ(capped.value().variants.front(), "solve problems and errors");
}

TEST(HeuristicQueryExpanderTest, CachePartitionsByScope) {
    HeuristicQueryExpander expander(SynonymTable{});
    auto a = expander.expand("embedding", "kb-a", sampleOf({"embeddings everywhere"}), 10);
    auto b = expander.expand("embedding", "kb-b", {}, 10);
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_FALSE(a.value().relatedTerms.empty());
    EXPECT_TRUE(b.value().relatedTerms.empty());

    // Same scope and query is served from cache even with a different sample
    auto again = expander.expand("embedding", "kb-b", sampleOf({"embeddings everywhere"}), 10);
    ASSERT_TRUE(again);
    EXPECT_TRUE(again.value().relatedTerms.empty());
}

} // namespace kbase::search
