#include <cairn/ingest/conversation.h>

#include <spdlog/spdlog.h>

#include <cctype>
#include <chrono>
#include <fstream>
#include <regex>
#include <sstream>

namespace cairn::ingest {

namespace {

struct Line {
    std::string_view text; // without the trailing newline
    std::size_t start = 0; // byte offset in the file
    std::size_t end = 0;   // offset one past the newline (or EOF)
};

std::vector<Line> splitLines(std::string_view content) {
    std::vector<Line> lines;
    std::size_t pos = 0;
    while (pos < content.size()) {
        auto nl = content.find('\n', pos);
        const std::size_t stop = nl == std::string_view::npos ? content.size() : nl;
        std::string_view text = content.substr(pos, stop - pos);
        if (!text.empty() && text.back() == '\r')
            text.remove_suffix(1);
        const std::size_t next = nl == std::string_view::npos ? content.size() : nl + 1;
        lines.push_back(Line{text, pos, next});
        pos = next;
    }
    return lines;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

const std::regex& uuidPattern() {
    static const std::regex re(
        "[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}");
    return re;
}

const std::regex& headerPattern() {
    static const std::regex re(R"(^\s*(#{1,6}\s*)?(\*\*)?(Prompt|Response):(\*\*)?\s*$)");
    return re;
}

std::optional<std::string> findSessionId(const std::vector<Line>& lines) {
    for (const auto& line : lines) {
        if (line.text.find("Link:") == std::string_view::npos)
            continue;
        std::string text(line.text);
        std::smatch m;
        if (std::regex_search(text, m, uuidPattern())) {
            std::string id = m.str(0);
            for (auto& c : id)
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            return id;
        }
    }
    return std::nullopt;
}

std::optional<Speaker> headerSpeaker(std::string_view line) {
    std::string text(line);
    std::smatch m;
    if (!std::regex_match(text, m, headerPattern()))
        return std::nullopt;
    return m.str(3) == "Prompt" ? Speaker::User : Speaker::Assistant;
}

// Number of leading backticks when the line opens or closes a fence (>= 3), else 0
std::size_t fenceWidth(std::string_view line) {
    line = trim(line);
    std::size_t n = 0;
    while (n < line.size() && line[n] == '`')
        ++n;
    return n >= 3 ? n : 0;
}

struct Body {
    std::string text;
    std::optional<std::string> reasoning;
    std::optional<TimePoint> timestamp;
};

Body splitBody(const std::vector<Line>& lines, std::size_t first, std::size_t last,
               Speaker speaker) {
    Body body;
    std::vector<std::string_view> kept;
    std::vector<std::string> reasoningBlocks;

    std::size_t i = first;
    while (i < last && trim(lines[i].text).empty())
        ++i;
    if (i < last) {
        if (auto ts = parseExportTimestamp(trim(lines[i].text))) {
            body.timestamp = ts;
            ++i;
        }
    }

    while (i < last) {
        const auto width = speaker == Speaker::Assistant ? fenceWidth(lines[i].text) : 0;
        if (width == 0) {
            kept.push_back(lines[i].text);
            ++i;
            continue;
        }

        // Find the closing fence of the same width
        std::size_t close = i + 1;
        while (close < last && !(fenceWidth(lines[close].text) == width &&
                                 trim(lines[close].text).size() == width))
            ++close;

        std::size_t contentStart = i + 1;
        while (contentStart < close && trim(lines[contentStart].text).empty())
            ++contentStart;
        const bool isReasoning =
            contentStart < close && trim(lines[contentStart].text).rfind("Thought process", 0) == 0;

        const std::size_t stop = close < last ? close + 1 : last;
        if (isReasoning) {
            std::string block;
            for (std::size_t k = contentStart; k < close; ++k) {
                block.append(lines[k].text);
                block.push_back('\n');
            }
            reasoningBlocks.emplace_back(trim(block));
        } else {
            for (std::size_t k = i; k < stop; ++k)
                kept.push_back(lines[k].text);
        }
        i = stop;
    }

    std::string joined;
    for (auto line : kept) {
        joined.append(line);
        joined.push_back('\n');
    }
    body.text = std::string(trim(joined));

    if (!reasoningBlocks.empty()) {
        std::string r;
        for (const auto& block : reasoningBlocks) {
            if (!r.empty())
                r += "\n\n";
            r += block;
        }
        body.reasoning = std::move(r);
    }
    return body;
}

} // namespace

const char* toString(Speaker s) {
    return s == Speaker::User ? "user" : "assistant";
}

std::optional<TimePoint> parseExportTimestamp(std::string_view line) {
    static const std::regex re(
        R"(^(\d{1,2})/(\d{1,2})/(\d{4}),\s+(\d{1,2}):(\d{2}):(\d{2})\s*([AaPp][Mm])$)");
    std::string text(trim(line));
    std::smatch m;
    if (!std::regex_match(text, m, re))
        return std::nullopt;

    const int month = std::stoi(m.str(1));
    const int day = std::stoi(m.str(2));
    const int year = std::stoi(m.str(3));
    int hour = std::stoi(m.str(4));
    const int minute = std::stoi(m.str(5));
    const int second = std::stoi(m.str(6));
    const bool pm = m.str(7)[0] == 'P' || m.str(7)[0] == 'p';

    if (hour < 1 || hour > 12 || minute > 59 || second > 59)
        return std::nullopt;
    if (hour == 12)
        hour = 0;
    if (pm)
        hour += 12;

    using namespace std::chrono;
    const year_month_day ymd{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
                             std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok())
        return std::nullopt;

    const auto tp = sys_days{ymd} + hours{hour} + minutes{minute} + seconds{second};
    return time_point_cast<TimePoint::duration>(tp);
}

Result<std::vector<ConversationMessage>>
ConversationParser::parse(std::string_view content, const std::string& sourceFile) const {
    const auto lines = splitLines(content);

    auto sessionId = findSessionId(lines);
    if (!sessionId) {
        return Error{ErrorCode::InvalidData, "No session link found in " + sourceFile};
    }

    struct Header {
        std::size_t line;
        Speaker speaker;
    };
    std::vector<Header> headers;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (auto speaker = headerSpeaker(lines[i].text))
            headers.push_back(Header{i, *speaker});
    }
    if (headers.empty()) {
        return Error{ErrorCode::InvalidData, "No Prompt:/Response: sections in " + sourceFile};
    }

    std::vector<ConversationMessage> messages;
    messages.reserve(headers.size());
    for (std::size_t h = 0; h < headers.size(); ++h) {
        const std::size_t first = headers[h].line + 1;
        const std::size_t last = h + 1 < headers.size() ? headers[h + 1].line : lines.size();

        auto body = splitBody(lines, first, last, headers[h].speaker);

        // End offset: last non-blank line of the section
        std::size_t endLine = last;
        while (endLine > first && trim(lines[endLine - 1].text).empty())
            --endLine;
        const std::size_t charEnd = endLine > first
                                        ? lines[endLine - 1].start + lines[endLine - 1].text.size()
                                        : lines[headers[h].line].start +
                                              lines[headers[h].line].text.size();

        ConversationMessage msg;
        msg.text = std::move(body.text);
        msg.speaker = headers[h].speaker;
        msg.timestamp = body.timestamp;
        msg.sessionId = *sessionId;
        msg.messageIndex = static_cast<std::int64_t>(h);
        msg.charStart = static_cast<std::int64_t>(lines[headers[h].line].start);
        msg.charEnd = static_cast<std::int64_t>(charEnd);
        msg.sourceFile = sourceFile;
        msg.assistantReasoning = std::move(body.reasoning);
        messages.push_back(std::move(msg));
    }

    spdlog::debug("Parsed {} messages from {} (session {})", messages.size(), sourceFile,
                  *sessionId);
    return messages;
}

Result<std::vector<ConversationMessage>>
ConversationParser::parseFile(const std::filesystem::path& path) const {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Cannot open " + path.string()};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return Error{ErrorCode::IoError, "Failed reading " + path.string()};
    }
    return parse(buffer.str(), path.filename().string());
}

} // namespace cairn::ingest
