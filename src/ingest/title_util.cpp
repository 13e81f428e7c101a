#include <cairn/ingest/title_util.h>

#include <cctype>

namespace cairn::ingest::util {

std::string slugify(std::string_view text, std::size_t maxWords) {
    std::string out;
    std::size_t taken = 0;
    std::size_t i = 0;

    while (i < text.size() && taken < maxWords) {
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])))
            ++i;
        if (i >= text.size())
            break;

        // One whitespace-delimited word counts against maxWords even if it strips empty
        std::string word;
        while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) {
            const auto c = static_cast<unsigned char>(text[i]);
            if (std::isalnum(c))
                word.push_back(static_cast<char>(std::tolower(c)));
            ++i;
        }
        ++taken;

        if (word.empty())
            continue;
        if (!out.empty())
            out.push_back('-');
        out += word;
    }
    return out;
}

} // namespace cairn::ingest::util
