#include <cairn/core/time_util.h>
#include <cairn/ingest/conversation.h>

#include <gtest/gtest.h>

#include "../../common/test_helpers.h"

using namespace cairn;
using namespace cairn::ingest;

namespace {

const std::string kExport =
    "# Training log\n"
    "\n"
    "**Created:** 1/31/2026 21:14:55\n"
    "**Link:** [https://claude.ai/chat/3F2A9C10-1B2C-4D5E-8F90-ABCDEF123456]"
    "(https://claude.ai/chat/3F2A9C10-1B2C-4D5E-8F90-ABCDEF123456)\n"
    "\n"
    "## Prompt:\n"
    "1/31/2026, 9:15:02 PM\n"
    "\n"
    "I ran 5K in 35 minutes today.\n"
    "My knee felt fine.\n"
    "\n"
    "## Response:\n"
    "1/31/2026, 9:15:40 PM\n"
    "\n"
    "````plaintext\n"
    "Thought process: The user is tracking runs.\n"
    "Keep it short.\n"
    "````\n"
    "\n"
    "Nice pace. Here is a plan:\n"
    "\n"
    "```\n"
    "week 1: 3 x 5K\n"
    "```\n"
    "\n"
    "## Prompt:\n"
    "12/1/2026, 12:05:09 AM\n"
    "\n"
    "Thanks!\n";

} // namespace

TEST(ConversationParserTest, SplitsTurnsAndExtractsSession) {
    ConversationParser parser;
    auto r = parser.parse(kExport, "training.md");
    ASSERT_TRUE(r) << r.error().message;
    const auto& msgs = r.value();
    ASSERT_EQ(msgs.size(), 3u);

    EXPECT_EQ(msgs[0].speaker, Speaker::User);
    EXPECT_EQ(msgs[1].speaker, Speaker::Assistant);
    EXPECT_EQ(msgs[2].speaker, Speaker::User);
    for (std::size_t i = 0; i < msgs.size(); ++i) {
        EXPECT_EQ(msgs[i].messageIndex, static_cast<std::int64_t>(i));
        EXPECT_EQ(msgs[i].sessionId, "3f2a9c10-1b2c-4d5e-8f90-abcdef123456");
        EXPECT_EQ(msgs[i].sourceFile, "training.md");
    }
    EXPECT_EQ(msgs[0].text, "I ran 5K in 35 minutes today.\nMy knee felt fine.");
    EXPECT_EQ(msgs[2].text, "Thanks!");
}

TEST(ConversationParserTest, ReadsTurnTimestamps) {
    ConversationParser parser;
    auto r = parser.parse(kExport, "training.md");
    ASSERT_TRUE(r);
    ASSERT_TRUE(r.value()[0].timestamp.has_value());
    EXPECT_EQ(core::formatIso8601(*r.value()[0].timestamp), "2026-01-31T21:15:02.000Z");
    ASSERT_TRUE(r.value()[2].timestamp.has_value());
    EXPECT_EQ(core::formatIso8601(*r.value()[2].timestamp), "2026-12-01T00:05:09.000Z");
}

TEST(ConversationParserTest, MovesReasoningOutOfAssistantText) {
    ConversationParser parser;
    auto r = parser.parse(kExport, "training.md");
    ASSERT_TRUE(r);
    const auto& reply = r.value()[1];
    ASSERT_TRUE(reply.assistantReasoning.has_value());
    EXPECT_EQ(*reply.assistantReasoning,
              "Thought process: The user is tracking runs.\nKeep it short.");
    EXPECT_EQ(reply.text.find("Thought process"), std::string::npos);
    // Ordinary code fences stay in the text
    EXPECT_NE(reply.text.find("week 1: 3 x 5K"), std::string::npos);
    EXPECT_FALSE(r.value()[0].assistantReasoning.has_value());
}

TEST(ConversationParserTest, OffsetsPointIntoTheExport) {
    ConversationParser parser;
    auto r = parser.parse(kExport, "training.md");
    ASSERT_TRUE(r);
    const auto& first = r.value()[0];
    EXPECT_EQ(first.charStart, static_cast<std::int64_t>(kExport.find("## Prompt:")));
    const auto endOfTurn = kExport.find("My knee felt fine.") + std::string("My knee felt fine.").size();
    EXPECT_EQ(first.charEnd, static_cast<std::int64_t>(endOfTurn));

    const auto& last = r.value()[2];
    EXPECT_EQ(last.charStart, static_cast<std::int64_t>(kExport.rfind("## Prompt:")));
    EXPECT_EQ(last.charEnd, static_cast<std::int64_t>(kExport.size() - 1));
}

TEST(ConversationParserTest, AcceptsBoldHeaders) {
    const std::string text = "Link: https://claude.ai/chat/00000000-0000-4000-8000-000000000001\n"
                             "**Prompt:**\n"
                             "hello\n"
                             "**Response:**\n"
                             "hi\n";
    ConversationParser parser;
    auto r = parser.parse(text, "bold.md");
    ASSERT_TRUE(r) << r.error().message;
    ASSERT_EQ(r.value().size(), 2u);
    EXPECT_EQ(r.value()[0].text, "hello");
    EXPECT_FALSE(r.value()[0].timestamp.has_value());
}

TEST(ConversationParserTest, RejectsExportsWithoutLinkOrTurns) {
    ConversationParser parser;
    auto noLink = parser.parse("## Prompt:\nhello\n", "a.md");
    ASSERT_FALSE(noLink);
    EXPECT_EQ(noLink.error().code, ErrorCode::InvalidData);

    auto noTurns =
        parser.parse("**Link:** https://claude.ai/chat/00000000-0000-4000-8000-000000000001\n",
                     "b.md");
    ASSERT_FALSE(noTurns);
    EXPECT_EQ(noTurns.error().code, ErrorCode::InvalidData);
}

TEST(ConversationParserTest, ParseFileUsesFileName) {
    auto dir = test::makeTempDir("cairn_parser_");
    auto path = test::writeFile(dir / "export.md", kExport);

    ConversationParser parser;
    auto r = parser.parseFile(path);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value()[0].sourceFile, "export.md");

    auto missing = parser.parseFile(dir / "nope.md");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::IoError);

    std::filesystem::remove_all(dir);
}

TEST(ExportTimestampTest, ParsesTwelveHourClock) {
    auto noon = parseExportTimestamp("2/10/2026, 12:00:00 PM");
    ASSERT_TRUE(noon);
    EXPECT_EQ(core::formatIso8601(*noon), "2026-02-10T12:00:00.000Z");

    auto midnight = parseExportTimestamp("2/10/2026, 12:30:00 AM");
    ASSERT_TRUE(midnight);
    EXPECT_EQ(core::formatIso8601(*midnight), "2026-02-10T00:30:00.000Z");
}

TEST(ExportTimestampTest, RejectsMalformedDates) {
    EXPECT_FALSE(parseExportTimestamp("2/30/2026, 9:00:00 AM"));
    EXPECT_FALSE(parseExportTimestamp("2/10/2026, 13:00:00 PM"));
    EXPECT_FALSE(parseExportTimestamp("2026-02-10T09:00:00Z"));
    EXPECT_FALSE(parseExportTimestamp("I ran 5K"));
}
