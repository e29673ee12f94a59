// Reference collection across knowledge bases and prompt formatting
#include <gtest/gtest.h>
#include <kbase/knowledge/knowledge_context.h>
#include <kbase/storage/knowledge_base_repository.h>
#include <kbase/storage/vector_store.h>

#include "common/test_helpers.h"

#include <nlohmann/json.hpp>

namespace kbase::knowledge {

class KnowledgeContextTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto client = std::make_shared<tests::FakeHttpClient>(
            tests::vectorTable({{"apples are red", {1.0f, 0.0f}},
                                {"pears are green", {0.8f, 0.6f}},
                                {"cars are fast", {0.0f, 1.0f}},
                                {"fruit", {1.0f, 0.0f}}}));
        auto catalog = std::make_shared<vector::StaticModelCatalog>();
        catalog->add(tests::makeGenericModel("fake-embed", 2));

        ManagerOptions options;
        options.retrieval.enableQueryExpansion = false;
        options.retrieval.enableHybridSearch = false;
        options.retrieval.enableDiversityFilter = false;
        options.retrieval.enableRerank = false;
        manager_ = std::make_shared<KnowledgeBaseManager>(
            std::make_shared<storage::InMemoryKnowledgeBaseRepository>(),
            std::make_shared<storage::InMemoryVectorStore>(), vector::makeEmbeddingProvider(client),
            catalog, nullptr, options);

        fruit_ = makeBase("Fruit", {"apples are red", "cars are fast"});
        more_ = makeBase("More fruit", {"pears are green"});
        service_ = std::make_unique<KnowledgeContextService>(manager_);
    }

    std::string makeBase(const std::string& name, const std::vector<std::string>& docs) {
        KnowledgeBaseDraft draft;
        draft.name = name;
        draft.model = "fake-embed";
        auto kb = manager_->createKnowledgeBase(draft);
        EXPECT_TRUE(kb);
        for (const auto& d : docs) {
            EXPECT_TRUE(manager_->addDocument(kb.value().id, d, {name}));
        }
        return kb.value().id;
    }

    ReferenceOptions options(size_t limit = 5, double threshold = 0.5) {
        ReferenceOptions o;
        o.limit = limit;
        o.threshold = threshold;
        return o;
    }

    std::shared_ptr<KnowledgeBaseManager> manager_;
    std::unique_ptr<KnowledgeContextService> service_;
    std::string fruit_;
    std::string more_;
};

TEST_F(KnowledgeContextTest, MergesBasesBestFirst) {
    auto refs = service_->collectReferences("msg-1", "fruit", {more_, fruit_}, options());
    ASSERT_TRUE(refs) << refs.error().message;
    ASSERT_EQ(refs.value().size(), 2u);

    EXPECT_EQ(refs.value()[0].content, "apples are red");
    EXPECT_EQ(refs.value()[0].knowledgeBaseName, "Fruit");
    EXPECT_NEAR(refs.value()[0].similarity, 1.0, 1e-9);
    EXPECT_EQ(refs.value()[0].sourceUrl.rfind("knowledge://" + fruit_ + "/", 0), 0u);

    EXPECT_EQ(refs.value()[1].content, "pears are green");
    EXPECT_EQ(refs.value()[1].knowledgeBaseId, more_);
    EXPECT_NEAR(refs.value()[1].similarity, 0.8, 1e-6);
    // Ids follow the order the bases were searched
    EXPECT_EQ(refs.value()[1].id, 1u);
    EXPECT_EQ(refs.value()[0].id, 2u);
}

TEST_F(KnowledgeContextTest, KeepsOnlyTheTopReferences) {
    auto refs = service_->collectReferences("msg-1", "fruit", {fruit_, more_}, options(1));
    ASSERT_TRUE(refs);
    ASSERT_EQ(refs.value().size(), 1u);
    EXPECT_EQ(refs.value()[0].content, "apples are red");
}

TEST_F(KnowledgeContextTest, UnknownBasesAreSkipped) {
    auto refs = service_->collectReferences("msg-1", "fruit", {"missing", more_}, options());
    ASSERT_TRUE(refs);
    ASSERT_EQ(refs.value().size(), 1u);
    EXPECT_EQ(refs.value()[0].knowledgeBaseId, more_);
}

TEST_F(KnowledgeContextTest, ZeroLimitIsInvalid) {
    auto refs = service_->collectReferences("msg-1", "fruit", {fruit_}, options(0));
    ASSERT_FALSE(refs);
    EXPECT_EQ(refs.error().code, ErrorCode::InvalidArgument);
}

TEST_F(KnowledgeContextTest, CachesReferencesPerMessage) {
    EXPECT_TRUE(service_->cachedReferences("msg-1").empty());
    ASSERT_TRUE(service_->collectReferences("msg-1", "fruit", {fruit_}, options()));
    EXPECT_EQ(service_->cachedReferences("msg-1").size(), 1u);

    // Collecting again for the same message replaces the cached list
    ASSERT_TRUE(service_->collectReferences("msg-1", "fruit", {fruit_, more_}, options()));
    EXPECT_EQ(service_->cachedReferences("msg-1").size(), 2u);

    service_->clearCache("msg-1");
    EXPECT_TRUE(service_->cachedReferences("msg-1").empty());
}

TEST_F(KnowledgeContextTest, FormatsReferencesAsJson) {
    EXPECT_TRUE(KnowledgeContextService::formatReferencesJson({}).empty());

    auto refs = service_->collectReferences("msg-1", "fruit", {fruit_, more_}, options());
    ASSERT_TRUE(refs);
    auto text = KnowledgeContextService::formatReferencesJson(refs.value());
    auto j = nlohmann::json::parse(text);
    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 2u);
    EXPECT_EQ(j[0]["content"], "apples are red");
    EXPECT_EQ(j[0]["knowledgeBaseName"], "Fruit");
    EXPECT_EQ(j[0]["type"], "file");
    EXPECT_TRUE(j[0]["sourceUrl"].get<std::string>().find(fruit_) != std::string::npos);
}

TEST_F(KnowledgeContextTest, FormatsContextGroupedByBase) {
    EXPECT_TRUE(KnowledgeContextService::formatReferencesContext({}).empty());

    std::vector<KnowledgeReference> refs(3);
    refs[0].content = "one";
    refs[0].knowledgeBaseName = "A";
    refs[0].similarity = 0.9;
    refs[1].content = "two";
    refs[1].knowledgeBaseName = "B";
    refs[1].similarity = 0.8;
    refs[2].content = "three";
    refs[2].knowledgeBaseName = "A";
    refs[2].similarity = 0.75;

    auto text = KnowledgeContextService::formatReferencesContext(refs);
    auto a = text.find("[A]:");
    auto b = text.find("[B]:");
    ASSERT_NE(a, std::string::npos);
    ASSERT_NE(b, std::string::npos);
    EXPECT_LT(a, b);
    EXPECT_NE(text.find("1. one (similarity: 90.0%)"), std::string::npos);
    EXPECT_NE(text.find("2. three (similarity: 75.0%)"), std::string::npos);
    EXPECT_NE(text.find("1. two (similarity: 80.0%)"), std::string::npos);
    EXPECT_LT(text.find("three"), b);
}

TEST(KnowledgeReferenceFormatTest, RoundsSimilarityToOneDecimal) {
    std::vector<KnowledgeReference> refs(1);
    refs[0].content = "rounded";
    refs[0].knowledgeBaseName = "A";
    refs[0].similarity = 0.8765;
    auto text = KnowledgeContextService::formatReferencesContext(refs);
    EXPECT_NE(text.find("1. rounded (similarity: 87.7%)"), std::string::npos) << text;
}

TEST(KnowledgeReferenceUrlTest, EncodesBaseAndChunk) {
    EXPECT_EQ(KnowledgeContextService::sourceUrlFor("kb1", "c9"), "knowledge://kb1/c9");
}

} // namespace kbase::knowledge
