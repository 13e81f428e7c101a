#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace cairn::ingest::util {

/**
 * Lowercase hyphenated slug of the first maxWords whitespace-separated words,
 * each stripped of non-alphanumeric characters. Words that strip to nothing are
 * dropped; the result may be empty.
 *
 *   slugify("I ran 5K in 35 minutes today") == "i-ran-5k-in-35"
 */
std::string slugify(std::string_view text, std::size_t maxWords = 5);

} // namespace cairn::ingest::util
