#include <cairn/ml/hash_embedding_provider.h>
#include <cairn/vector/similarity_index.h>

#include <gtest/gtest.h>

using namespace cairn;
using namespace cairn::ml;

TEST(HashEmbeddingProviderTest, RequiresInitialize) {
    HashEmbeddingProvider provider(64);
    auto r = provider.generateEmbedding("hello");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotInitialized);
}

TEST(HashEmbeddingProviderTest, DeterministicUnitVectors) {
    HashEmbeddingProvider provider(64);
    ASSERT_TRUE(provider.initialize());
    EXPECT_EQ(provider.getModelName(), "hash-64");
    EXPECT_EQ(provider.getEmbeddingDimension(), 64u);

    auto a = provider.generateEmbedding("I ran 5K today");
    auto b = provider.generateEmbedding("I ran 5K today");
    auto c = provider.generateEmbedding("Coffee makes me anxious");
    ASSERT_TRUE(a && b && c);
    EXPECT_EQ(a.value(), b.value());
    EXPECT_EQ(a.value().size(), 64u);
    EXPECT_NEAR(vector::l2Norm(a.value()), 1.0, 1e-5);
    EXPECT_NEAR(vector::cosineSimilarity(a.value(), b.value()), 1.0, 1e-6);
    EXPECT_LT(vector::cosineSimilarity(a.value(), c.value()), 0.95);
}

TEST(HashEmbeddingProviderTest, BatchKeepsOrder) {
    HashEmbeddingProvider provider(32);
    ASSERT_TRUE(provider.initialize());
    auto batch = provider.generateBatchEmbeddings({"one", "two"});
    ASSERT_TRUE(batch);
    ASSERT_EQ(batch.value().size(), 2u);
    EXPECT_EQ(batch.value()[1], provider.generateEmbedding("two").value());
}

TEST(HashEmbeddingProviderTest, ZeroDimensionRejected) {
    HashEmbeddingProvider provider(0);
    auto r = provider.initialize();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}

TEST(EmbeddingFactoryTest, UnknownProviderIsInvalidArgument) {
    EmbeddingProviderConfig cfg;
    cfg.provider = "word2vec";
    auto r = createEmbeddingProvider(cfg);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);

    cfg.provider = "mock";
    cfg.dimensions = 8;
    auto mock = createEmbeddingProvider(cfg);
    ASSERT_TRUE(mock) << mock.error().message;
    EXPECT_EQ(mock.value()->getProviderName(), "hash");
    EXPECT_TRUE(mock.value()->generateEmbedding("x"));
}
