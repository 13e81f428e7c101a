#include <cairn/ingest/ingestion_service.h>
#include <cairn/storage/knowledge_base.h>

#include <gtest/gtest.h>

#include <algorithm>

#include "../../common/test_helpers.h"

using namespace cairn;
using namespace cairn::ingest;
using namespace cairn::metadata;
using cairn::test::makeProposition;

class IngestionServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto kb = storage::KnowledgeBase::open(storage::KnowledgeBaseConfig{});
        ASSERT_TRUE(kb) << kb.error().message;
        kb_ = std::move(kb).value();
        extractor_ = std::make_shared<test::StubExtractionProvider>();
        embedder_ = std::make_shared<test::MapEmbeddingProvider>();
        service_ = std::make_unique<IngestionService>(*kb_, extractor_, embedder_);
    }

    // Registers one proposition with a fixed vector for a message of the same text
    void single(const std::string& text, std::vector<float> vec) {
        extractor_->responses[text] = {makeProposition(text)};
        embedder_->vectors[text] = std::move(vec);
    }

    IngestionResult mustIngest(const std::string& text, const SessionMetadata& meta = {}) {
        auto r = service_->ingestMessage(text, meta);
        EXPECT_TRUE(r) << (r ? "" : r.error().message);
        return r ? r.value() : IngestionResult{};
    }

    std::int64_t leafCount() {
        auto n = kb_->store().countNodes(NodeVariant::Leaf);
        EXPECT_TRUE(n);
        return n ? n.value() : -1;
    }

    ConversationMessage userTurn(const std::string& text, std::int64_t index) {
        ConversationMessage m;
        m.text = text;
        m.speaker = Speaker::User;
        m.sessionId = "3f2a9c10-1b2c-4d5e-8f90-abcdef123456";
        m.messageIndex = index;
        m.sourceFile = "log.md";
        return m;
    }

    std::unique_ptr<storage::KnowledgeBase> kb_;
    std::shared_ptr<test::StubExtractionProvider> extractor_;
    std::shared_ptr<test::MapEmbeddingProvider> embedder_;
    std::unique_ptr<IngestionService> service_;
};

TEST_F(IngestionServiceTest, StoresLeafWithPayloadAndProvenance) {
    const std::string text = "I ran 5K in 35 minutes at 6:54/km pace";
    auto prop = makeProposition(text, NodePurpose::Observation, 0.95);
    prop.structuredData = {{"activity", "run"},
                           {"distance_km", 5},
                           {"duration_minutes", 35},
                           {"pace", "6:54/km"}};
    extractor_->responses[text] = {prop};

    SessionMetadata meta;
    meta.sessionId = "3f2a9c10-1b2c-4d5e-8f90-abcdef123456";
    meta.messageIndex = 4;
    meta.charStart = 120;
    meta.charEnd = 170;
    meta.sourceFile = "log.md";

    auto result = mustIngest(text, meta);
    EXPECT_EQ(result.propositionsExtracted, 1u);
    EXPECT_EQ(result.propositionsStored, 1u);
    EXPECT_EQ(result.duplicatesFound, 0u);
    ASSERT_EQ(result.nodeIds.size(), 1u);
    EXPECT_EQ(result.sessionId, meta.sessionId);

    auto node = kb_->store().getNode(result.nodeIds[0]);
    ASSERT_TRUE(node);
    ASSERT_TRUE(node.value().has_value());
    const Node& leaf = *node.value();
    EXPECT_EQ(leaf.variant(), NodeVariant::Leaf);
    EXPECT_EQ(leaf.title, "i-ran-5k-in-35");
    EXPECT_EQ(leaf.content, text);

    const auto* belief = leaf.belief();
    ASSERT_NE(belief, nullptr);
    EXPECT_EQ(belief->source, "conversation");
    EXPECT_DOUBLE_EQ(belief->confidence, 0.95);
    EXPECT_EQ(belief->purpose, NodePurpose::Observation);
    EXPECT_EQ(belief->structuredData["distance_km"], 5);
    EXPECT_EQ(belief->structuredData["duration_minutes"], 35);
    EXPECT_EQ(belief->structuredData["pace"], "6:54/km");
    EXPECT_EQ(belief->provenance.sessionId, meta.sessionId);
    EXPECT_EQ(belief->provenance.messageIndex, 4);
    EXPECT_EQ(belief->provenance.charStart, 120);
    EXPECT_EQ(belief->provenance.charEnd, 170);
    EXPECT_EQ(belief->provenance.sourceFile, "log.md");

    auto embeddings = kb_->store().getEmbeddings(leaf.id);
    ASSERT_TRUE(embeddings);
    ASSERT_EQ(embeddings.value().size(), 1u);
    EXPECT_EQ(embeddings.value()[0].model, "map-test");

    // Later re-ingestion of the same run
    auto again = mustIngest(text);
    EXPECT_EQ(again.duplicatesFound, 1u);
    EXPECT_TRUE(again.nodeIds.empty());
    EXPECT_EQ(leafCount(), 1);
}

TEST_F(IngestionServiceTest, SameMessageTwiceStoresNothingNew) {
    const std::string text = "I sleep better after evening runs";
    single(text, test::basis(0));

    auto first = mustIngest(text);
    EXPECT_EQ(first.propositionsStored, 1u);

    auto second = mustIngest(text);
    EXPECT_EQ(second.propositionsExtracted, 1u);
    EXPECT_EQ(second.propositionsStored, 0u);
    EXPECT_EQ(second.duplicatesFound, 1u);
    EXPECT_TRUE(second.nodeIds.empty());
    EXPECT_EQ(leafCount(), 1);
}

TEST_F(IngestionServiceTest, SimilarityBandsDecideDuplicateLinkOrNothing) {
    single("base", test::basis(0));
    auto base = mustIngest("base");
    ASSERT_EQ(base.nodeIds.size(), 1u);

    // 0.97: same claim
    single("restated", test::atCosine(0.97));
    auto restated = mustIngest("restated");
    EXPECT_EQ(restated.propositionsStored, 0u);
    EXPECT_EQ(restated.duplicatesFound, 1u);

    // 0.90: related claim, stored and linked
    single("related", test::atCosine(0.90));
    auto related = mustIngest("related");
    ASSERT_EQ(related.propositionsStored, 1u);
    EXPECT_EQ(related.edgesCreated, 1u);

    auto exists = kb_->store().edgeExists(related.nodeIds[0], base.nodeIds[0], EdgeType::SimilarTo);
    ASSERT_TRUE(exists);
    EXPECT_TRUE(exists.value());

    auto edges = kb_->store().getRelated(base.nodeIds[0], EdgeType::SimilarTo);
    ASSERT_TRUE(edges);
    ASSERT_EQ(edges.value().size(), 1u);
    ASSERT_TRUE(edges.value()[0].edge.props.confidence.has_value());
    EXPECT_NEAR(*edges.value()[0].edge.props.confidence, 0.90, 1e-4);

    // 0.5: unrelated
    single("unrelated", test::atCosine(0.5));
    auto unrelated = mustIngest("unrelated");
    EXPECT_EQ(unrelated.propositionsStored, 1u);
    EXPECT_EQ(unrelated.edgesCreated, 0u);

    EXPECT_EQ(leafCount(), 3);
}

TEST_F(IngestionServiceTest, DuplicatesWithinOneMessageAreCaught) {
    const std::string text = "Long message";
    extractor_->responses[text] = {makeProposition("I run on Tuesdays"),
                                   makeProposition("On Tuesdays I run"),
                                   makeProposition("Intervals help my pace")};
    embedder_->vectors["I run on Tuesdays"] = test::basis(2);
    embedder_->vectors["On Tuesdays I run"] = test::atCosine(0.99, 2, 3);
    embedder_->vectors["Intervals help my pace"] = test::atCosine(0.9, 2, 4);

    auto result = mustIngest(text);
    EXPECT_EQ(result.propositionsExtracted, 3u);
    EXPECT_EQ(result.propositionsStored, 2u);
    EXPECT_EQ(result.duplicatesFound, 1u);
    ASSERT_EQ(result.propositions.size(), 2u);
    EXPECT_EQ(result.propositions[0].text, "I run on Tuesdays");
    EXPECT_EQ(result.propositions[1].text, "Intervals help my pace");
    // Siblings link once, not in both directions
    EXPECT_EQ(result.edgesCreated, 1u);
    auto edges = kb_->store().countEdges(EdgeType::SimilarTo);
    ASSERT_TRUE(edges);
    EXPECT_EQ(edges.value(), 1);
}

TEST_F(IngestionServiceTest, LinksAreCappedPerNode) {
    IngestionConfig cfg;
    cfg.maxLinksPerNode = 2;
    IngestionService capped(*kb_, extractor_, embedder_, cfg);

    for (std::size_t i = 0; i < 4; ++i) {
        const std::string text = "neighbour " + std::to_string(i);
        // Pairwise below the related threshold, all close to basis(0)
        std::vector<float> v(test::kTestDim, 0.0f);
        v[0] = 0.9f;
        v[1 + i] = std::sqrt(1.0f - 0.81f);
        single(text, v);
        ASSERT_TRUE(capped.ingestMessage(text));
    }

    single("centre", test::basis(0));
    auto r = capped.ingestMessage("centre");
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().edgesCreated, 2u);
}

TEST_F(IngestionServiceTest, EmbeddingFailurePropagatesAndStoresNothing) {
    const std::string text = "The API is down";
    extractor_->responses[text] = {makeProposition("first"), makeProposition("second")};
    embedder_->failing.insert("second");

    auto r = service_->ingestMessage(text);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::Timeout);
    EXPECT_EQ(leafCount(), 0);
}

TEST_F(IngestionServiceTest, ExtractionFailurePropagates) {
    extractor_->failing.insert("boom");
    auto r = service_->ingestMessage("boom");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ProviderError);
}

TEST_F(IngestionServiceTest, BlankMessageSkipsExtraction) {
    auto result = mustIngest("   \n\t");
    EXPECT_EQ(result.propositionsExtracted, 0u);
    EXPECT_TRUE(extractor_->calls.empty());
}

TEST_F(IngestionServiceTest, MissingCollaboratorsAreNotInitialized) {
    IngestionService broken(*kb_, nullptr, embedder_);
    auto r = broken.ingestMessage("anything");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotInitialized);
}

TEST_F(IngestionServiceTest, InvalidPropositionRejectsMessageBeforeAnyWrite) {
    const std::string text = "Two claims, one broken";
    extractor_->responses[text] = {
        makeProposition("I slept eight hours", NodePurpose::Observation, 0.9),
        makeProposition("I feel rested", NodePurpose::Observation, 1.5)};

    auto r = service_->ingestMessage(text);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ExtractionError);
    EXPECT_NE(r.error().message.find("Proposition 1"), std::string::npos) << r.error().message;
    EXPECT_EQ(leafCount(), 0);

    auto batch = service_->ingestBatch({userTurn(text, 0)});
    EXPECT_EQ(batch.totalStored, 0u);
    ASSERT_EQ(batch.errors.size(), 1u);
    EXPECT_EQ(batch.errors[0].code, ErrorCode::ExtractionError);
    EXPECT_EQ(leafCount(), 0);
}

TEST_F(IngestionServiceTest, NonObjectStructuredDataIsRejected) {
    auto prop = makeProposition("I ran 3K");
    prop.structuredData = nlohmann::json::array({1, 2});
    extractor_->responses["run"] = {prop};

    auto r = service_->ingestMessage("run");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ExtractionError);
    EXPECT_EQ(leafCount(), 0);
}

TEST_F(IngestionServiceTest, FailedMessageStillCountsItsSession) {
    extractor_->failing.insert("only message");
    ConversationMessage turn = userTurn("only message", 0);
    turn.sessionId = "00000000-0000-4000-8000-0000000000ff";

    auto batch = service_->ingestBatch({turn});
    EXPECT_EQ(batch.errors.size(), 1u);
    EXPECT_EQ(batch.sessionsProcessed.count("00000000-0000-4000-8000-0000000000ff"), 1u);
}

TEST_F(IngestionServiceTest, BatchRecordsFailuresAndContinues) {
    single("m0", test::basis(8));
    single("m1", test::basis(9));
    single("m2", test::basis(10));
    extractor_->failing.insert("m1");

    ConversationMessage reply = userTurn("assistant says hi", 3);
    reply.speaker = Speaker::Assistant;

    auto batch = service_->ingestBatch({userTurn("m0", 0), userTurn("m1", 1),
                                        userTurn("m2", 2), reply});
    EXPECT_EQ(batch.totalMessages, 3u);
    EXPECT_EQ(batch.totalStored, 2u);
    ASSERT_EQ(batch.errors.size(), 1u);
    EXPECT_EQ(batch.errors[0].messageIndex, 1);
    EXPECT_EQ(batch.errors[0].sourceFile, "log.md");
    EXPECT_EQ(batch.errors[0].code, ErrorCode::ProviderError);
    EXPECT_EQ(batch.sessionsProcessed.count("3f2a9c10-1b2c-4d5e-8f90-abcdef123456"), 1u);

    EXPECT_EQ(std::count(extractor_->calls.begin(), extractor_->calls.end(),
                         "assistant says hi"),
              0);
    EXPECT_EQ(leafCount(), 2);

    auto bySession = kb_->store().findNodesBySession("3f2a9c10-1b2c-4d5e-8f90-abcdef123456");
    ASSERT_TRUE(bySession);
    ASSERT_EQ(bySession.value().size(), 2u);
    EXPECT_EQ(bySession.value()[0].content, "m0");
    EXPECT_EQ(bySession.value()[1].content, "m2");
}

TEST_F(IngestionServiceTest, ImportsDirectoryOfExports) {
    auto dir = test::makeTempDir("cairn_import_");
    test::writeFile(dir / "a.md",
                    "**Link:** https://claude.ai/chat/00000000-0000-4000-8000-0000000000aa\n"
                    "## Prompt:\n"
                    "I stretch every morning\n"
                    "## Response:\n"
                    "Good habit.\n");
    test::writeFile(dir / "broken.md", "no link here\n## Prompt:\nhello\n");
    test::writeFile(dir / "notes.txt", "ignored");
    single("I stretch every morning", test::basis(11));

    auto r = service_->ingestDirectory(dir);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().totalMessages, 1u);
    EXPECT_EQ(r.value().totalStored, 1u);
    EXPECT_EQ(r.value().sessionsProcessed.count("00000000-0000-4000-8000-0000000000aa"), 1u);
    ASSERT_EQ(r.value().errors.size(), 1u);
    EXPECT_FALSE(r.value().errors[0].messageIndex.has_value());
    EXPECT_EQ(r.value().errors[0].sourceFile, "broken.md");
    EXPECT_EQ(r.value().errors[0].code, ErrorCode::InvalidData);

    auto notDir = service_->ingestDirectory(dir / "a.md");
    ASSERT_FALSE(notDir);
    EXPECT_EQ(notDir.error().code, ErrorCode::IoError);

    std::filesystem::remove_all(dir);
}
