#ifndef SRC_CHRONOSLOTS_LOG_LEVEL_HPP_
#define SRC_CHRONOSLOTS_LOG_LEVEL_HPP_

#include "spdlog/common.h"

#include <string_view>

namespace chronoslots {

// Names accepted by parseLogLevel(), for flag help text.
constexpr const char* kLogLevelNames = "trace, debug, info, warn, error, critical, off";

// Sets |level| from its spdlog name, also accepting "warn" and "err". Returns false, leaving |level| unmodified, if
// |name| isn't a level name.
bool parseLogLevel(std::string_view name, spdlog::level::level_enum& level);

} // namespace chronoslots

#endif // SRC_CHRONOSLOTS_LOG_LEVEL_HPP_
