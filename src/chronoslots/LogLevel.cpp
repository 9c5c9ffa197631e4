#include "chronoslots/LogLevel.hpp"

#include <string>

namespace chronoslots {

bool parseLogLevel(std::string_view name, spdlog::level::level_enum& level) {
    // spdlog maps any unknown name to off.
    auto parsed = spdlog::level::from_str(std::string(name));
    if (parsed == spdlog::level::off && name != "off") {
        return false;
    }
    level = parsed;
    return true;
}

} // namespace chronoslots
