// KnowledgeBaseManager: lifecycle, ingestion, degraded fallback and search
#include <gtest/gtest.h>
#include <kbase/knowledge/knowledge_base_manager.h>
#include <kbase/storage/knowledge_base_repository.h>
#include <kbase/storage/vector_store.h>

#include "common/test_helpers.h"

#include <string>

namespace kbase::knowledge {

using tests::FakeHttpClient;
using tests::RecordingEventListener;

class KnowledgeBaseManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        client_ = std::make_shared<FakeHttpClient>(tests::constantVector({1.0f, 0.0f}));
        catalog_ = std::make_shared<vector::StaticModelCatalog>();
        catalog_->add(tests::makeGenericModel("fake-embed", 2));
        catalog_->add(tests::makeGenericModel("wide-embed", 16));
        repo_ = std::make_shared<storage::InMemoryKnowledgeBaseRepository>();
        store_ = std::make_shared<storage::InMemoryVectorStore>();
        events_ = std::make_shared<RecordingEventListener>();

        ManagerOptions options;
        options.fallbackVector = [](size_t dims) { return Embedding(dims, 0.5f); };
        manager_ = std::make_unique<KnowledgeBaseManager>(
            repo_, store_, vector::makeEmbeddingProvider(client_), catalog_, events_, options);
    }

    KnowledgeBase create(const std::string& name, const std::string& model = "fake-embed") {
        KnowledgeBaseDraft draft;
        draft.name = name;
        draft.model = model;
        auto r = manager_->createKnowledgeBase(draft);
        EXPECT_TRUE(r) << (r ? "" : r.error().message);
        return r ? r.value() : KnowledgeBase{};
    }

    static std::string textOf(size_t n) {
        std::string s;
        for (size_t i = 0; i < n; ++i)
            s.push_back(static_cast<char>('a' + i % 26));
        return s;
    }

    std::shared_ptr<FakeHttpClient> client_;
    std::shared_ptr<vector::StaticModelCatalog> catalog_;
    std::shared_ptr<storage::InMemoryKnowledgeBaseRepository> repo_;
    std::shared_ptr<storage::InMemoryVectorStore> store_;
    std::shared_ptr<RecordingEventListener> events_;
    std::unique_ptr<KnowledgeBaseManager> manager_;
};

// ============================================================================
// Knowledge bases
// ============================================================================

TEST_F(KnowledgeBaseManagerTest, CreateAppliesDefaultsAndProbesDimensions) {
    auto kb = create("Docs");
    EXPECT_FALSE(kb.id.empty());
    EXPECT_EQ(kb.dimensions, 2u);
    EXPECT_EQ(kb.documentCount, 5u);
    EXPECT_EQ(kb.chunkSize, 1000u);
    EXPECT_EQ(kb.chunkOverlap, 200u);
    EXPECT_DOUBLE_EQ(kb.threshold, 0.7);
    EXPECT_EQ(kb.createdAt, kb.updatedAt);
    ASSERT_EQ(events_->created.size(), 1u);
    EXPECT_EQ(events_->created[0], kb.id);
}

TEST_F(KnowledgeBaseManagerTest, CreateUsesDeclaredWidthWhenProbeFails) {
    client_->setHandler({});
    auto kb = create("Wide", "wide-embed");
    EXPECT_EQ(kb.dimensions, 16u);
}

TEST_F(KnowledgeBaseManagerTest, CreateRejectsInvalidSettings) {
    KnowledgeBaseDraft noName;
    noName.model = "fake-embed";
    EXPECT_EQ(manager_->createKnowledgeBase(noName).error().code, ErrorCode::InvalidArgument);

    KnowledgeBaseDraft badOverlap;
    badOverlap.name = "x";
    badOverlap.model = "fake-embed";
    badOverlap.chunkSize = 100;
    badOverlap.chunkOverlap = 100;
    EXPECT_EQ(manager_->createKnowledgeBase(badOverlap).error().code, ErrorCode::InvalidConfig);

    KnowledgeBaseDraft badThreshold;
    badThreshold.name = "x";
    badThreshold.model = "fake-embed";
    badThreshold.threshold = 1.5;
    EXPECT_EQ(manager_->createKnowledgeBase(badThreshold).error().code,
              ErrorCode::InvalidConfig);

    EXPECT_TRUE(manager_->listKnowledgeBases().value().empty());
}

TEST_F(KnowledgeBaseManagerTest, GetAndListAndUpdate) {
    auto a = create("A");
    auto b = create("B");

    auto list = manager_->listKnowledgeBases();
    ASSERT_TRUE(list);
    ASSERT_EQ(list.value().size(), 2u);
    EXPECT_EQ(list.value()[0].id, a.id);
    EXPECT_EQ(list.value()[1].id, b.id);

    KnowledgeBasePatch patch;
    patch.name = "A2";
    patch.threshold = 0.4;
    patch.documentCount = 9;
    auto updated = manager_->updateKnowledgeBase(a.id, patch);
    ASSERT_TRUE(updated) << updated.error().message;
    EXPECT_EQ(updated.value().name, "A2");
    EXPECT_DOUBLE_EQ(updated.value().threshold, 0.4);
    EXPECT_EQ(updated.value().documentCount, 9u);
    EXPECT_GE(updated.value().updatedAt, updated.value().createdAt);
    EXPECT_EQ(manager_->getKnowledgeBase(a.id).value().name, "A2");
    ASSERT_EQ(events_->updated.size(), 1u);
}

TEST_F(KnowledgeBaseManagerTest, UnknownBaseIsNotFound) {
    EXPECT_EQ(manager_->getKnowledgeBase("missing").error().code, ErrorCode::NotFound);
    EXPECT_EQ(manager_->deleteKnowledgeBase("missing").error().code, ErrorCode::NotFound);
    EXPECT_EQ(manager_->addDocument("missing", "text", {"src"}).error().code,
              ErrorCode::NotFound);
    SearchRequest req;
    req.knowledgeBaseId = "missing";
    req.query = "q";
    EXPECT_EQ(manager_->search(req).error().code, ErrorCode::NotFound);
}

TEST_F(KnowledgeBaseManagerTest, ModelChangeOnPopulatedBaseIsRejected) {
    auto kb = create("Docs");
    ASSERT_TRUE(manager_->addDocument(kb.id, "some content", {"notes"}));

    KnowledgeBasePatch patch;
    patch.model = "wide-embed";
    auto r = manager_->updateKnowledgeBase(kb.id, patch);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::DimensionMismatch);
    EXPECT_NE(r.error().message.find("recreate the knowledge base"), std::string::npos);

    KnowledgeBasePatch dims;
    dims.dimensions = 4;
    EXPECT_EQ(manager_->updateKnowledgeBase(kb.id, dims).error().code,
              ErrorCode::DimensionMismatch);
}

TEST_F(KnowledgeBaseManagerTest, ModelChangeOnEmptyBaseReResolvesWidth) {
    auto kb = create("Docs");
    client_->setHandler({});
    KnowledgeBasePatch patch;
    patch.model = "wide-embed";
    auto r = manager_->updateKnowledgeBase(kb.id, patch);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().model, "wide-embed");
    EXPECT_EQ(r.value().dimensions, 16u);
}

TEST_F(KnowledgeBaseManagerTest, DeleteCascadesToChunksOfThatBaseOnly) {
    auto a = create("A");
    auto b = create("B");
    ASSERT_TRUE(manager_->addDocument(a.id, textOf(2500), {"a.txt"}));
    ASSERT_TRUE(manager_->addDocument(b.id, "short", {"b.txt"}));

    auto removed = manager_->deleteKnowledgeBase(a.id);
    ASSERT_TRUE(removed);
    EXPECT_EQ(removed.value(), 3u);
    EXPECT_EQ(manager_->getKnowledgeBase(a.id).error().code, ErrorCode::NotFound);
    EXPECT_TRUE(store_->listByKnowledgeBase(a.id).value().empty());
    EXPECT_EQ(manager_->listDocuments(b.id).value().size(), 1u);
    ASSERT_EQ(events_->deleted.size(), 1u);
    EXPECT_EQ(events_->deleted[0], std::make_pair(a.id, size_t{3}));
}

// ============================================================================
// Documents
// ============================================================================

TEST_F(KnowledgeBaseManagerTest, IngestsLongDocumentIntoOverlappingChunks) {
    auto kb = create("Docs");
    auto text = textOf(2500);
    SourceMetadata source{"manual.txt", std::string("manual.txt"), std::string("file-7")};

    auto added = manager_->addDocument(kb.id, text, source);
    ASSERT_TRUE(added) << added.error().message;
    const auto& chunks = added.value();
    ASSERT_EQ(chunks.size(), 3u);
    for (size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].metadata.chunkIndex, i);
        EXPECT_EQ(chunks[i].knowledgeBaseId, kb.id);
        EXPECT_EQ(chunks[i].vector.size(), 2u);
        EXPECT_FALSE(chunks[i].metadata.degraded);
        EXPECT_EQ(chunks[i].metadata.fileId.value(), "file-7");
    }
    EXPECT_EQ(chunks[0].content.substr(800), chunks[1].content.substr(0, 200));
    EXPECT_EQ(chunks[1].content.substr(800), chunks[2].content.substr(0, 200));
    EXPECT_EQ(chunks[2].content, text.substr(1600));

    ASSERT_EQ(events_->progress.size(), 3u);
    for (size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(events_->progress[i].current, i + 1);
        EXPECT_EQ(events_->progress[i].total, 3u);
        EXPECT_EQ(events_->progress[i].chunkId, chunks[i].id);
    }
    ASSERT_EQ(events_->added.size(), 1u);
    EXPECT_EQ(events_->added[0].second, 3u);
    EXPECT_TRUE(events_->degraded.empty());

    auto listed = manager_->listDocuments(kb.id);
    ASSERT_TRUE(listed);
    ASSERT_EQ(listed.value().size(), 3u);
    EXPECT_EQ(listed.value()[2].id, chunks[2].id);
}

TEST_F(KnowledgeBaseManagerTest, EmptyDocumentAddsNothing) {
    auto kb = create("Docs");
    auto added = manager_->addDocument(kb.id, "", {"empty.txt"});
    ASSERT_TRUE(added);
    EXPECT_TRUE(added.value().empty());
    ASSERT_EQ(events_->added.size(), 1u);
    EXPECT_EQ(events_->added[0].second, 0u);
}

TEST_F(KnowledgeBaseManagerTest, WrongWidthFromModelIsDimensionMismatch) {
    KnowledgeBaseDraft draft;
    draft.name = "Three";
    draft.model = "fake-embed";
    draft.dimensions = 3;
    auto kb = manager_->createKnowledgeBase(draft);
    ASSERT_TRUE(kb);

    auto added = manager_->addDocument(kb.value().id, "content", {"src"});
    ASSERT_FALSE(added);
    EXPECT_EQ(added.error().code, ErrorCode::DimensionMismatch);
}

TEST_F(KnowledgeBaseManagerTest, FailingProviderStoresDegradedFallbackChunks) {
    client_->setHandler({});
    auto kb = create("Offline", "wide-embed");
    ASSERT_EQ(kb.dimensions, 16u);

    auto added = manager_->addDocument(kb.id, textOf(2500), {"offline.txt"});
    ASSERT_TRUE(added) << added.error().message;
    ASSERT_EQ(added.value().size(), 3u);
    for (const auto& c : added.value()) {
        EXPECT_TRUE(c.metadata.degraded);
        EXPECT_EQ(c.vector.size(), 16u);
    }
    ASSERT_EQ(events_->degraded.size(), 3u);
    EXPECT_EQ(events_->degraded[1].chunkIndex, 1u);
    EXPECT_FALSE(events_->degraded[1].reason.empty());

    // The query falls back too and still matches the base's width
    SearchRequest req;
    req.knowledgeBaseId = kb.id;
    req.query = "anything";
    auto results = manager_->search(req);
    ASSERT_TRUE(results) << results.error().message;

    req.useEnhanced = false;
    auto plain = manager_->search(req);
    ASSERT_TRUE(plain);
    EXPECT_EQ(plain.value().size(), 3u);

    EXPECT_EQ(manager_->listDegradedChunks(kb.id).value().size(), 3u);
}

TEST_F(KnowledgeBaseManagerTest, DegradedQueryDoesNotEmbedExpansionVariants) {
    client_->setHandler({});
    auto kb = create("Offline", "wide-embed");
    ASSERT_TRUE(manager_->addDocument(kb.id, textOf(1500), {"offline.txt"}));

    SearchRequest req;
    req.knowledgeBaseId = kb.id;
    req.query = "errors and problems";
    req.useEnhanced = false;
    auto before = client_->calls();
    ASSERT_TRUE(manager_->search(req));
    const auto plainCalls = client_->calls() - before;
    EXPECT_EQ(plainCalls, 1u);

    req.useEnhanced = true;
    before = client_->calls();
    auto enhanced = manager_->search(req);
    ASSERT_TRUE(enhanced) << enhanced.error().message;
    EXPECT_EQ(client_->calls() - before, plainCalls);
}

TEST_F(KnowledgeBaseManagerTest, UnconfiguredModelDegradesInsteadOfFailing) {
    KnowledgeBaseDraft draft;
    draft.name = "Orphan";
    draft.model = "not-in-catalog";
    draft.dimensions = 4;
    auto kb = manager_->createKnowledgeBase(draft);
    ASSERT_TRUE(kb);

    auto added = manager_->addDocument(kb.value().id, "text", {"src"});
    ASSERT_TRUE(added);
    ASSERT_EQ(added.value().size(), 1u);
    EXPECT_TRUE(added.value()[0].metadata.degraded);
    EXPECT_EQ(client_->calls(), 0u);
}

TEST_F(KnowledgeBaseManagerTest, ReembedRepairsDegradedChunksInPlace) {
    client_->setHandler({});
    auto kb = create("Repair");
    ASSERT_TRUE(manager_->addDocument(kb.id, textOf(2500), {"doc"}));
    auto before = manager_->listDocuments(kb.id).value();
    ASSERT_EQ(manager_->listDegradedChunks(kb.id).value().size(), 3u);

    // Still offline: nothing repaired
    EXPECT_EQ(manager_->reembedDegradedChunks(kb.id).value(), 0u);

    client_->setHandler(tests::constantVector({0.0f, 1.0f}));
    auto repaired = manager_->reembedDegradedChunks(kb.id);
    ASSERT_TRUE(repaired) << repaired.error().message;
    EXPECT_EQ(repaired.value(), 3u);
    EXPECT_TRUE(manager_->listDegradedChunks(kb.id).value().empty());

    auto after = manager_->listDocuments(kb.id).value();
    ASSERT_EQ(after.size(), before.size());
    for (size_t i = 0; i < after.size(); ++i) {
        EXPECT_EQ(after[i].id, before[i].id);
        EXPECT_EQ(after[i].vector, (Embedding{0.0f, 1.0f}));
    }
}

TEST_F(KnowledgeBaseManagerTest, DeleteDocumentReportsMissingChunks) {
    auto kb = create("Docs");
    auto added = manager_->addDocument(kb.id, "content", {"src"});
    ASSERT_TRUE(added);
    const auto id = added.value()[0].id;

    EXPECT_TRUE(manager_->deleteDocument(id).value());
    EXPECT_FALSE(manager_->deleteDocument(id).value());
    ASSERT_EQ(events_->documentsDeleted.size(), 1u);
    EXPECT_EQ(events_->documentsDeleted[0], id);
}

// ============================================================================
// Search
// ============================================================================

TEST_F(KnowledgeBaseManagerTest, PlainSearchReturnsOnlyChunksAboveThreshold) {
    client_->setHandler(tests::vectorTable(
        {{"alpha", {1.0f, 0.0f}}, {"beta", {0.0f, 1.0f}}, {"query", {1.0f, 0.0f}}}));
    auto kb = create("Two");
    ASSERT_TRUE(manager_->addDocument(kb.id, "alpha", {"a"}));
    ASSERT_TRUE(manager_->addDocument(kb.id, "beta", {"b"}));

    SearchRequest req;
    req.knowledgeBaseId = kb.id;
    req.query = "query";
    req.threshold = 0.5;
    req.limit = 5;
    req.useEnhanced = false;
    auto results = manager_->search(req);
    ASSERT_TRUE(results) << results.error().message;
    ASSERT_EQ(results.value().size(), 1u);
    EXPECT_EQ(results.value()[0].content, "alpha");
    EXPECT_DOUBLE_EQ(results.value()[0].score, 1.0);

    req.useEnhanced = true;
    auto enhanced = manager_->search(req);
    ASSERT_TRUE(enhanced);
    ASSERT_EQ(enhanced.value().size(), 1u);
    EXPECT_EQ(enhanced.value()[0].content, "alpha");
}

TEST_F(KnowledgeBaseManagerTest, SearchDefaultsToBaseDocumentCount) {
    KnowledgeBaseDraft draft;
    draft.name = "Small";
    draft.model = "fake-embed";
    draft.documentCount = 2;
    draft.chunkSize = 10;
    draft.chunkOverlap = 0;
    auto kb = manager_->createKnowledgeBase(draft);
    ASSERT_TRUE(kb);
    ASSERT_EQ(manager_->addDocument(kb.value().id, textOf(50), {"s"}).value().size(), 5u);

    SearchRequest req;
    req.knowledgeBaseId = kb.value().id;
    req.query = "q";
    req.useEnhanced = false;
    EXPECT_EQ(manager_->search(req).value().size(), 2u);

    req.limit = 0;
    EXPECT_EQ(manager_->search(req).value().size(), 2u);

    req.limit = 4;
    EXPECT_EQ(manager_->search(req).value().size(), 4u);
}

TEST_F(KnowledgeBaseManagerTest, EmptyBaseSearchIsEmpty) {
    auto kb = create("Empty");
    SearchRequest req;
    req.knowledgeBaseId = kb.id;
    req.query = "q";
    auto results = manager_->search(req);
    ASSERT_TRUE(results);
    EXPECT_TRUE(results.value().empty());
}

TEST_F(KnowledgeBaseManagerTest, StoredVectorsOfAnotherWidthAreDimensionMismatch) {
    auto kb = create("Docs");
    ChunkRecord foreign;
    foreign.id = "foreign";
    foreign.knowledgeBaseId = kb.id;
    foreign.content = "from another model";
    foreign.vector = Embedding(5, 0.1f);
    ASSERT_TRUE(store_->put(foreign));

    SearchRequest req;
    req.knowledgeBaseId = kb.id;
    req.query = "q";
    auto enhanced = manager_->search(req);
    ASSERT_FALSE(enhanced);
    EXPECT_EQ(enhanced.error().code, ErrorCode::DimensionMismatch);

    req.useEnhanced = false;
    EXPECT_EQ(manager_->search(req).error().code, ErrorCode::DimensionMismatch);
}

TEST_F(KnowledgeBaseManagerTest, BrokenRetrievalConfigFallsBackToPlainSearch) {
    auto kb = create("Docs");
    ASSERT_TRUE(manager_->addDocument(kb.id, textOf(2500), {"doc"}));

    search::RetrievalConfig broken;
    broken.maxCandidates = 0;
    EnhancedSearchRequest req;
    req.knowledgeBaseId = kb.id;
    req.query = "q";
    req.config = broken;
    auto enhanced = manager_->enhancedSearch(req);
    ASSERT_TRUE(enhanced) << enhanced.error().message;

    SearchRequest plainReq;
    plainReq.knowledgeBaseId = kb.id;
    plainReq.query = "q";
    plainReq.useEnhanced = false;
    auto plain = manager_->search(plainReq);
    ASSERT_TRUE(plain);
    ASSERT_EQ(enhanced.value().size(), plain.value().size());
    for (size_t i = 0; i < plain.value().size(); ++i) {
        EXPECT_EQ(enhanced.value()[i].chunkId, plain.value()[i].chunkId);
        EXPECT_DOUBLE_EQ(enhanced.value()[i].score, plain.value()[i].score);
    }
}

TEST_F(KnowledgeBaseManagerTest, RepeatedQueriesHitTheEmbeddingCache) {
    auto kb = create("Docs");
    ASSERT_TRUE(manager_->addDocument(kb.id, "content", {"src"}));
    SearchRequest req;
    req.knowledgeBaseId = kb.id;
    req.query = "same question";
    req.useEnhanced = false;
    ASSERT_TRUE(manager_->search(req));
    auto calls = client_->calls();
    ASSERT_TRUE(manager_->search(req));
    EXPECT_EQ(client_->calls(), calls);
}

} // namespace kbase::knowledge
