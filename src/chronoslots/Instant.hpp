#ifndef SRC_CHRONOSLOTS_INSTANT_HPP_
#define SRC_CHRONOSLOTS_INSTANT_HPP_

#include <chrono>
#include <cstdint>
#include <limits>
#include <string>

namespace chronoslots {

// Time resolution is one second, and absolute time is measured in seconds since the first of January 1970. Timezone
// handling is up to callers, all formatting here is in UTC. Any int64_t number of seconds is a valid Instant.
using Duration = std::chrono::seconds;
using Instant = std::chrono::time_point<std::chrono::system_clock, Duration>;

inline Instant makeInstant(int64_t secondsSinceEpoch) { return Instant(Duration(secondsSinceEpoch)); }
inline int64_t secondsSinceEpoch(Instant instant) { return instant.time_since_epoch().count(); }

// Exact number of seconds from |start| to |end|, which must not be before |start|. Two int64_t values can be up to
// 2^64 - 1 apart, so the difference is taken in unsigned arithmetic.
inline uint64_t elapsedSeconds(Instant start, Instant end) {
    return static_cast<uint64_t>(secondsSinceEpoch(end)) - static_cast<uint64_t>(secondsSinceEpoch(start));
}

// The Duration from |start| to |end|, capped at the largest representable Duration.
inline Duration elapsed(Instant start, Instant end) {
    uint64_t seconds = elapsedSeconds(start, end);
    constexpr auto kMaxSeconds = static_cast<uint64_t>(std::numeric_limits<Duration::rep>::max());
    return Duration(static_cast<Duration::rep>(seconds > kMaxSeconds ? kMaxSeconds : seconds));
}

// Renders |instant| as "%Y-%m-%d %H:%M:%S", or as "@<seconds since epoch>" if the calendar date can't be
// represented.
std::string formatInstant(Instant instant);

} // namespace chronoslots

#endif // SRC_CHRONOSLOTS_INSTANT_HPP_
