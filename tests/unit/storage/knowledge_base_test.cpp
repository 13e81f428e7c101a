#include <cairn/storage/knowledge_base.h>

#include <gtest/gtest.h>

#include "../../common/test_helpers.h"

using namespace cairn;
using namespace cairn::metadata;
using cairn::storage::KnowledgeBase;
using cairn::storage::KnowledgeBaseConfig;

namespace {

NodeDraft leafDraft(const std::string& content) {
    NodeDraft draft;
    draft.title = content;
    draft.content = content;
    draft.payload = LeafPayload{};
    return draft;
}

} // namespace

class KnowledgeBaseTest : public ::testing::Test {
protected:
    void SetUp() override { dbPath_ = test::tempDbPath("knowledge_base_test_"); }
    void TearDown() override { test::removeDb(dbPath_); }

    KnowledgeBaseConfig config(bool verify = true) const {
        KnowledgeBaseConfig cfg;
        cfg.dbPath = dbPath_.string();
        cfg.verifyOnOpen = verify;
        return cfg;
    }

    std::unique_ptr<KnowledgeBase> mustOpen(bool verify = true) {
        auto kb = KnowledgeBase::open(config(verify));
        EXPECT_TRUE(kb) << (kb ? "" : kb.error().message);
        return kb ? std::move(kb).value() : nullptr;
    }

    std::filesystem::path dbPath_;
};

TEST_F(KnowledgeBaseTest, StoredNodeIsImmediatelySearchable) {
    auto kb = mustOpen();
    ASSERT_NE(kb, nullptr);

    auto node = kb->storeNodeWithEmbedding(leafDraft("I ran 5K"), EmbeddingType::Content,
                                           test::basis(0), "map-test");
    ASSERT_TRUE(node) << node.error().message;

    auto hits = kb->findSimilar(test::atCosine(0.9), EmbeddingType::Content, 0.85);
    ASSERT_TRUE(hits);
    ASSERT_EQ(hits.value().size(), 1u);
    EXPECT_EQ(hits.value()[0].nodeId, node.value().id);
    EXPECT_NEAR(hits.value()[0].score, 0.9, 1e-5);

    auto embeddings = kb->store().getEmbeddings(node.value().id);
    ASSERT_TRUE(embeddings);
    ASSERT_EQ(embeddings.value().size(), 1u);
    EXPECT_EQ(embeddings.value()[0].model, "map-test");
}

TEST_F(KnowledgeBaseTest, ReopenRebuildsIndexFromStore) {
    NodeId first;
    {
        auto kb = mustOpen();
        ASSERT_NE(kb, nullptr);
        auto a = kb->storeNodeWithEmbedding(leafDraft("a"), EmbeddingType::Content,
                                            test::basis(0), "m");
        auto b = kb->storeNodeWithEmbedding(leafDraft("b"), EmbeddingType::Content,
                                            test::basis(1), "m");
        ASSERT_TRUE(a && b);
        first = a.value().id;
    }

    auto kb = mustOpen();
    ASSERT_NE(kb, nullptr);
    EXPECT_EQ(kb->index().size(EmbeddingType::Content), 2u);

    auto hits = kb->findSimilar(test::basis(0), EmbeddingType::Content, 0.99);
    ASSERT_TRUE(hits);
    ASSERT_EQ(hits.value().size(), 1u);
    EXPECT_EQ(hits.value()[0].nodeId, first);
}

TEST_F(KnowledgeBaseTest, DimensionMismatchIsRejectedBeforeWriting) {
    auto kb = mustOpen();
    ASSERT_NE(kb, nullptr);
    ASSERT_TRUE(kb->storeNodeWithEmbedding(leafDraft("a"), EmbeddingType::Content,
                                           test::basis(0), "m"));

    auto wrong = kb->storeNodeWithEmbedding(leafDraft("b"), EmbeddingType::Content,
                                            test::basis(0, 8), "m");
    ASSERT_FALSE(wrong);
    EXPECT_EQ(wrong.error().code, ErrorCode::InvalidData);

    auto leaves = kb->store().countNodes(NodeVariant::Leaf);
    ASSERT_TRUE(leaves);
    EXPECT_EQ(leaves.value(), 1);
}

TEST_F(KnowledgeBaseTest, LeafWithoutEmbeddingFailsVerificationUntilBackfilled) {
    {
        auto store = makeSqliteGraphStore(dbPath_.string());
        ASSERT_TRUE(store);
        ASSERT_TRUE(store.value()->createNode(leafDraft("orphan belief")));
    }

    auto strict = KnowledgeBase::open(config(true));
    ASSERT_FALSE(strict);
    EXPECT_EQ(strict.error().code, ErrorCode::CorruptedData);

    auto kb = mustOpen(false);
    ASSERT_NE(kb, nullptr);
    test::MapEmbeddingProvider embedder;
    embedder.vectors["orphan belief"] = test::basis(3);

    auto repaired = kb->backfillEmbeddings(embedder);
    ASSERT_TRUE(repaired) << repaired.error().message;
    EXPECT_EQ(repaired.value(), 1u);
    EXPECT_TRUE(kb->verifyInvariants());
    EXPECT_EQ(kb->index().size(EmbeddingType::Content), 1u);

    auto again = kb->backfillEmbeddings(embedder);
    ASSERT_TRUE(again);
    EXPECT_EQ(again.value(), 0u);
}

TEST_F(KnowledgeBaseTest, BackfillStopsOnEmbeddingFailure) {
    {
        auto store = makeSqliteGraphStore(dbPath_.string());
        ASSERT_TRUE(store);
        ASSERT_TRUE(store.value()->createNode(leafDraft("unreachable")));
    }
    auto kb = mustOpen(false);
    ASSERT_NE(kb, nullptr);

    test::MapEmbeddingProvider embedder;
    embedder.failing.insert("unreachable");
    auto r = kb->backfillEmbeddings(embedder);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::Timeout);
}

TEST_F(KnowledgeBaseTest, BackfillRejectsWrongWidthWithoutWriting) {
    {
        auto kb = mustOpen();
        ASSERT_NE(kb, nullptr);
        ASSERT_TRUE(kb->storeNodeWithEmbedding(leafDraft("eight wide"), EmbeddingType::Content,
                                               test::basis(0, 8), "m"));
        ASSERT_TRUE(kb->store().createNode(leafDraft("needs a vector")));
    }

    auto kb = mustOpen(false);
    ASSERT_NE(kb, nullptr);
    test::MapEmbeddingProvider wide(16);
    auto r = kb->backfillEmbeddings(wide);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidData);

    auto stored = kb->store().countEmbeddings(EmbeddingType::Content);
    ASSERT_TRUE(stored);
    EXPECT_EQ(stored.value(), 1);
    kb.reset();

    // The file still opens and a matching embedder can finish the repair
    kb = mustOpen(false);
    ASSERT_NE(kb, nullptr);
    test::MapEmbeddingProvider narrow(8);
    auto repaired = kb->backfillEmbeddings(narrow);
    ASSERT_TRUE(repaired) << repaired.error().message;
    EXPECT_EQ(repaired.value(), 1u);
    EXPECT_TRUE(kb->verifyInvariants());
}

TEST_F(KnowledgeBaseTest, CreateRequiresStore) {
    auto kb = KnowledgeBase::create(nullptr);
    ASSERT_FALSE(kb);
    EXPECT_EQ(kb.error().code, ErrorCode::InvalidArgument);
}
