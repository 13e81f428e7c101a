#pragma once

#include <cairn/core/types.h>

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace cairn::core {

// Timestamps are persisted as unix epoch milliseconds.
inline std::int64_t toUnixMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline TimePoint fromUnixMillis(std::int64_t ms) {
    return TimePoint{std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds{ms})};
}

// Current time truncated to millisecond precision so values round-trip through storage.
inline TimePoint nowMillis() {
    return fromUnixMillis(toUnixMillis(std::chrono::system_clock::now()));
}

/**
 * Format as ISO 8601 UTC with millisecond precision: 2026-02-10T21:53:12.123Z
 */
inline std::string formatIso8601(TimePoint tp) {
    auto time_t_tp = std::chrono::system_clock::to_time_t(tp);
    auto millis = toUnixMillis(tp) % 1000;
    if (millis < 0)
        millis += 1000;

    std::tm tm_utc;
    gmtime_r(&time_t_tp, &tm_utc);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis << 'Z';
    return oss.str();
}

} // namespace cairn::core
