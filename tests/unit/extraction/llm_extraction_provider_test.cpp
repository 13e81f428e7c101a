#include <cairn/extraction/extraction_provider.h>
#include <cairn/ml/provider.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace cairn;
using namespace cairn::extraction;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Return;

namespace {

class MockCompletionProvider : public ml::ICompletionProvider {
public:
    MOCK_METHOD(Result<std::string>, complete, (const std::string&, const std::string&),
                (override));
    std::string getProviderName() const override { return "mock"; }
    std::string getModelName() const override { return "mock-model"; }
};

} // namespace

TEST(LlmExtractionProviderTest, SendsMessageWithSystemPrompt) {
    auto completion = std::make_shared<MockCompletionProvider>();
    EXPECT_CALL(*completion, complete("I ran 5K", HasSubstr("propositions")))
        .WillOnce(Return(Result<std::string>(std::string(
            R"({"propositions":[{"proposition":"I ran 5K","node_purpose":"observation",)"
            R"("confidence":0.9,"source_type":"explicit"}]})"))));

    LlmExtractionProvider extractor(completion);
    auto r = extractor.extract("I ran 5K");
    ASSERT_TRUE(r) << r.error().message;
    ASSERT_EQ(r.value().size(), 1u);
    EXPECT_EQ(r.value()[0].text, "I ran 5K");
}

TEST(LlmExtractionProviderTest, ProviderFailurePropagates) {
    auto completion = std::make_shared<MockCompletionProvider>();
    EXPECT_CALL(*completion, complete(_, _))
        .WillOnce(Return(Result<std::string>(Error{ErrorCode::NetworkError, "down"})));

    LlmExtractionProvider extractor(completion);
    auto r = extractor.extract("anything");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NetworkError);
}

TEST(LlmExtractionProviderTest, OffSchemaAnswerIsExtractionError) {
    auto completion = std::make_shared<MockCompletionProvider>();
    EXPECT_CALL(*completion, complete(_, _))
        .WillOnce(Return(Result<std::string>(std::string("Sure! Here are your propositions."))));

    LlmExtractionProvider extractor(completion);
    auto r = extractor.extract("anything");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ExtractionError);
}

TEST(ExtractionPromptTest, DescribesTheSchema) {
    const auto& prompt = extractionSystemPrompt();
    for (const char* field :
         {"proposition", "node_purpose", "confidence", "source_type", "structured_data"}) {
        EXPECT_NE(prompt.find(field), std::string::npos) << field;
    }
}
