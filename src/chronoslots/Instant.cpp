#include "chronoslots/Instant.hpp"

#include "fmt/chrono.h"
#include "fmt/format.h"

#include <ctime>
#include <time.h>

namespace chronoslots {

std::string formatInstant(Instant instant) {
    auto time = static_cast<std::time_t>(secondsSinceEpoch(instant));
    // gmtime_r fails for years outside of the int range of std::tm, where fmt::gmtime would throw.
    std::tm calendar;
    if (gmtime_r(&time, &calendar) == nullptr) {
        return fmt::format("@{}", secondsSinceEpoch(instant));
    }
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", calendar);
}

} // namespace chronoslots
