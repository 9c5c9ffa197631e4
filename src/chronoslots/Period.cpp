#include "chronoslots/Period.hpp"

#include "fmt/format.h"

namespace chronoslots {

std::string formatRange(Instant start, Instant end) {
    uint64_t seconds = elapsedSeconds(start, end);
    uint64_t hours = seconds / 3600;
    uint64_t minutes = (seconds / 60) % 60;
    return fmt::format("start: {}, end: {}, duration: {}h {}m", formatInstant(start), formatInstant(end), hours,
            minutes);
}

} // namespace chronoslots
