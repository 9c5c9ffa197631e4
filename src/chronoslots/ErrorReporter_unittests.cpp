#include "chronoslots/ErrorReporter.hpp"

#include "doctest/doctest.h"

#include <cstdint>
#include <limits>

namespace chronoslots {

TEST_CASE("ErrorReporter") {
    SUBCASE("starts empty") {
        ErrorReporter er(true);
        CHECK(er.ok());
        CHECK(er.errorCount() == 0);
    }
    SUBCASE("invalid range message") {
        ErrorReporter er(true);
        er.addInvalidRangeError(makeInstant(3600), makeInstant(0));
        REQUIRE(er.errorCount() == 1);
        CHECK(!er.ok());
        CHECK(er.errors()[0].kind == PeriodError::kInvalidRange);
        CHECK(er.errors()[0].message
              == "Start time must be before end time. Got start: 1970-01-01 01:00:00, end: 1970-01-01 00:00:00.");
    }
    SUBCASE("invalid range message at extreme instants") {
        ErrorReporter er(true);
        er.addInvalidRangeError(makeInstant(std::numeric_limits<int64_t>::max()), makeInstant(0));
        REQUIRE(er.errorCount() == 1);
        CHECK(er.errors()[0].message
              == "Start time must be before end time. Got start: @9223372036854775807, end: 1970-01-01 00:00:00.");
    }
    SUBCASE("clear") {
        ErrorReporter er(true);
        er.addError(PeriodError::kInvalidRange, "one");
        er.addError(PeriodError::kInvalidRange, "two");
        CHECK(er.errorCount() == 2);
        er.clear();
        CHECK(er.ok());
    }
}

} // namespace chronoslots
