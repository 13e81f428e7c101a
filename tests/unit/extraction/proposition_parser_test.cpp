#include <cairn/extraction/proposition.h>

#include <gtest/gtest.h>

using namespace cairn;
using namespace cairn::extraction;
using metadata::NodePurpose;
using metadata::SourceType;

namespace {

const char* kRunResponse = R"({
  "propositions": [
    {
      "proposition": "I ran 5K in 35 minutes today",
      "node_purpose": "observation",
      "confidence": 0.95,
      "source_type": "explicit",
      "structured_data": {"activity": "run", "distance_km": 5, "duration_minutes": 35}
    },
    {
      "proposition": "Running regularly is improving my endurance",
      "node_purpose": "belief",
      "confidence": 0.6,
      "source_type": "inferred",
      "structured_data": null
    }
  ]
})";

} // namespace

TEST(PropositionParserTest, ParsesCanonicalResponse) {
    auto r = parseExtractionResponse(kRunResponse);
    ASSERT_TRUE(r) << r.error().message;
    ASSERT_EQ(r.value().size(), 2u);

    const auto& run = r.value()[0];
    EXPECT_EQ(run.text, "I ran 5K in 35 minutes today");
    EXPECT_EQ(run.purpose, NodePurpose::Observation);
    EXPECT_DOUBLE_EQ(run.confidence, 0.95);
    EXPECT_EQ(run.sourceType, SourceType::Explicit);
    EXPECT_EQ(run.structuredData["distance_km"], 5);
    EXPECT_EQ(run.structuredData["duration_minutes"], 35);

    const auto& belief = r.value()[1];
    EXPECT_EQ(belief.purpose, NodePurpose::Belief);
    EXPECT_EQ(belief.sourceType, SourceType::Inferred);
    EXPECT_TRUE(belief.structuredData.is_null());
}

TEST(PropositionParserTest, ToleratesJsonFence) {
    std::string fenced = std::string("```json\n") + kRunResponse + "\n```";
    auto r = parseExtractionResponse(fenced);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().size(), 2u);
    EXPECT_EQ(stripCodeFence("```\n{}\n```"), "{}");
    EXPECT_EQ(stripCodeFence("  {\"a\":1}  "), "{\"a\":1}");
}

TEST(PropositionParserTest, EmptyListIsFine) {
    auto r = parseExtractionResponse(R"({"propositions": []})");
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.value().empty());
}

TEST(PropositionParserTest, UnknownPurposeCoercedAndLegacyKeyAccepted) {
    auto r = parseExtractionResponse(R"({"propositions": [
        {"proposition": "a", "node_purpose": "musing", "confidence": 0.5, "source_type": "explicit"},
        {"proposition": "b", "node_type": "decision", "confidence": 0.5, "source_type": "explicit"}
    ]})");
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value()[0].purpose, NodePurpose::Observation);
    EXPECT_EQ(r.value()[1].purpose, NodePurpose::Decision);
}

TEST(PropositionParserTest, SchemaViolationsAreExtractionErrors) {
    const std::vector<std::string> bad = {
        "not json at all",
        R"(["propositions"])",
        R"({"items": []})",
        R"({"propositions": {}})",
        R"({"propositions": [{"node_purpose": "belief", "confidence": 0.5, "source_type": "explicit"}]})",
        R"({"propositions": [{"proposition": "  ", "node_purpose": "belief", "confidence": 0.5, "source_type": "explicit"}]})",
        R"({"propositions": [{"proposition": "x", "confidence": 0.5, "source_type": "explicit"}]})",
        R"({"propositions": [{"proposition": "x", "node_purpose": "belief", "confidence": 1.5, "source_type": "explicit"}]})",
        R"({"propositions": [{"proposition": "x", "node_purpose": "belief", "confidence": "high", "source_type": "explicit"}]})",
        R"({"propositions": [{"proposition": "x", "node_purpose": "belief", "confidence": 0.5, "source_type": "guessed"}]})",
        R"({"propositions": [{"proposition": "x", "node_purpose": "belief", "confidence": 0.5, "source_type": "explicit", "structured_data": [1]}]})",
    };
    for (const auto& raw : bad) {
        auto r = parseExtractionResponse(raw);
        ASSERT_FALSE(r) << raw;
        EXPECT_EQ(r.error().code, ErrorCode::ExtractionError) << raw;
    }
}

TEST(PropositionParserTest, ErrorNamesTheOffendingEntry) {
    auto r = parseExtractionResponse(R"({"propositions": [
        {"proposition": "fine", "node_purpose": "belief", "confidence": 0.5, "source_type": "explicit"},
        {"proposition": "broken", "node_purpose": "belief", "confidence": -0.1, "source_type": "explicit"}
    ]})");
    ASSERT_FALSE(r);
    EXPECT_NE(r.error().message.find("Proposition 1"), std::string::npos) << r.error().message;
}

TEST(PropositionParserTest, JsonRoundTripUsesSchemaNames) {
    Proposition p;
    p.text = "I decided to run three times a week";
    p.purpose = NodePurpose::Decision;
    p.confidence = 0.8;
    auto j = toJson(p);
    EXPECT_EQ(j["proposition"], p.text);
    EXPECT_EQ(j["node_purpose"], "decision");
    EXPECT_EQ(j["source_type"], "explicit");
}

TEST(PropositionParserTest, ValidateCatchesHandBuiltPropositions) {
    Proposition ok;
    ok.text = "I ran 5K";
    EXPECT_TRUE(validateProposition(ok, 0));

    Proposition tooSure = ok;
    tooSure.confidence = 1.5;
    auto r = validateProposition(tooSure, 3);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ExtractionError);
    EXPECT_NE(r.error().message.find("Proposition 3"), std::string::npos);

    Proposition blank = ok;
    blank.text = "  ";
    EXPECT_FALSE(validateProposition(blank, 0));

    Proposition listData = ok;
    listData.structuredData = nlohmann::json::array();
    EXPECT_FALSE(validateProposition(listData, 0));
}
