#pragma once

#include <cairn/core/types.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cairn::ingest {

enum class Speaker { User, Assistant };

const char* toString(Speaker s);

/**
 * One turn of an exported conversation.
 */
struct ConversationMessage {
    std::string text; // assistant reasoning blocks removed
    Speaker speaker = Speaker::User;
    std::optional<TimePoint> timestamp;
    std::string sessionId;
    std::int64_t messageIndex = 0;    // order within the conversation
    std::int64_t charStart = 0;       // byte offset of the turn header in the export
    std::int64_t charEnd = 0;         // one past the last byte of the turn
    std::string sourceFile;           // file name of the export
    std::optional<std::string> assistantReasoning;
};

/**
 * Parser for Markdown conversation exports.
 *
 * Expected layout:
 *
 *   # Title
 *   **Link:** [https://claude.ai/chat/<uuid>](https://claude.ai/chat/<uuid>)
 *
 *   ## Prompt:
 *   1/31/2026, 9:15:02 PM
 *
 *   user text
 *
 *   ## Response:
 *   1/31/2026, 9:15:40 PM
 *
 *   ````plaintext
 *   Thought process: ...
 *   ````
 *
 *   assistant text
 *
 * The session id is the first UUID on the Link line. "Thought process" fenced blocks
 * in responses move to assistantReasoning.
 */
class ConversationParser {
public:
    // InvalidData when there is no session link or no message
    Result<std::vector<ConversationMessage>> parse(std::string_view content,
                                                   const std::string& sourceFile) const;

    // IoError when the file cannot be read
    Result<std::vector<ConversationMessage>> parseFile(const std::filesystem::path& path) const;
};

// "M/D/YYYY, H:MM:SS AM/PM" interpreted as UTC
std::optional<TimePoint> parseExportTimestamp(std::string_view line);

} // namespace cairn::ingest
