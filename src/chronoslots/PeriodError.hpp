#ifndef SRC_CHRONOSLOTS_PERIOD_ERROR_HPP_
#define SRC_CHRONOSLOTS_PERIOD_ERROR_HPP_

#include <cstdint>

namespace chronoslots {

enum class PeriodError : int32_t {
    // A requested period has a start time at or after its end time.
    kInvalidRange = 1
};

const char* periodErrorMessage(PeriodError error);

} // namespace chronoslots

#endif // SRC_CHRONOSLOTS_PERIOD_ERROR_HPP_
