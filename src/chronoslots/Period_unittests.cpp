#include "chronoslots/Period.hpp"

#include "chronoslots/Block.hpp"
#include "chronoslots/ErrorReporter.hpp"
#include "chronoslots/PeriodTestFixture.hpp"
#include "chronoslots/Slot.hpp"
#include "chronoslots/Span.hpp"

#include "doctest/doctest.h"

#include <cstdint>
#include <limits>
#include <vector>

namespace chronoslots {

TEST_CASE("Instant formatting") {
    CHECK(formatInstant(makeInstant(0)) == "1970-01-01 00:00:00");
    CHECK(formatInstant(makeInstant(1704099600)) == "2024-01-01 09:00:00");
    CHECK(secondsSinceEpoch(makeInstant(-3600)) == -3600);
}

TEST_CASE("Instant extremes") {
    SUBCASE("dates outside the calendar fall back to epoch seconds") {
        CHECK(formatInstant(makeInstant(int64_t(1) << 60)) == "@1152921504606846976");
        CHECK(formatInstant(makeInstant(std::numeric_limits<int64_t>::min()))
              == "@-9223372036854775808");
        CHECK(formatInstant(makeInstant(std::numeric_limits<int64_t>::max())) == "@9223372036854775807");
    }
    SUBCASE("elapsed time across the whole range") {
        auto lowest = makeInstant(std::numeric_limits<int64_t>::min());
        auto highest = makeInstant(std::numeric_limits<int64_t>::max());
        CHECK(elapsedSeconds(lowest, highest) == std::numeric_limits<uint64_t>::max());
        CHECK(elapsed(lowest, highest) == Duration(std::numeric_limits<int64_t>::max()));
        CHECK(elapsedSeconds(makeInstant(-10), makeInstant(10)) == 20);
        CHECK(elapsed(makeInstant(-10), makeInstant(10)) == Duration(20));
    }
    SUBCASE("wide period") {
        auto wide = Span::make(makeInstant((std::numeric_limits<int64_t>::min() / 2) - 10),
                makeInstant((std::numeric_limits<int64_t>::max() / 2) + 10));
        REQUIRE(wide);
        CHECK(elapsedSeconds(wide->start(), wide->end()) == (uint64_t(1) << 63) + 19);
        CHECK(wide->duration() == Duration(std::numeric_limits<int64_t>::max()));
        CHECK(wide->toString() == "start: @-4611686018427387914, end: @4611686018427387913, duration: "
                                  "2562047788015215h 30m");
    }
}

TEST_CASE_FIXTURE(PeriodTestFixture, "Period construction") {
    SUBCASE("start before end") {
        ErrorReporter er(true);
        auto b = Block::make(hours(0), hours(8), &er);
        REQUIRE(b);
        CHECK(b->start() == hours(0));
        CHECK(b->end() == hours(8));
        CHECK(b->duration() == Duration(8 * 3600));
        CHECK(er.ok());
    }
    SUBCASE("equal endpoints") {
        ErrorReporter er(true);
        CHECK(!Block::make(hours(3), hours(3), &er));
        CHECK(!Span::make(hours(3), hours(3), &er));
        CHECK(!Slot::make(hours(3), hours(3), &er));
        REQUIRE(er.errorCount() == 3);
        for (const auto& error : er.errors()) {
            CHECK(error.kind == PeriodError::kInvalidRange);
        }
    }
    SUBCASE("inverted endpoints") {
        ErrorReporter er(true);
        CHECK(!Block::make(hours(8), hours(0), &er));
        REQUIRE(er.errorCount() == 1);
        CHECK(er.errors().front().kind == PeriodError::kInvalidRange);
    }
    SUBCASE("no reporter") {
        CHECK(!Span::make(hours(1), hours(0)));
        CHECK(Span::make(hours(0), makeInstant(secondsSinceEpoch(hours(0)) + 1)));
    }
}

TEST_CASE_FIXTURE(PeriodTestFixture, "Period ordering") {
    CHECK(block(0, 1) == block(0, 1));
    CHECK(block(0, 1) != block(0, 2));
    CHECK(block(0, 1) < block(0, 2));
    CHECK(block(0, 5) < block(1, 2));
    CHECK(!(block(1, 2) < block(1, 2)));
}

TEST_CASE_FIXTURE(PeriodTestFixture, "Period toString") {
    SUBCASE("whole hours") {
        CHECK(block(0, 8).toString()
              == "start: 2024-01-01 09:00:00, end: 2024-01-01 17:00:00, duration: 8h 0m");
    }
    SUBCASE("hours and minutes") {
        auto s = Span::make(hours(0), makeInstant(secondsSinceEpoch(hours(2)) + (45 * 60)));
        REQUIRE(s);
        CHECK(s->toString() == "start: 2024-01-01 09:00:00, end: 2024-01-01 11:45:00, duration: 2h 45m");
    }
    SUBCASE("sequence") {
        std::vector<Slot> slots{slot(0, 1), slot(3, 4), slot(5, 6)};
        CHECK(formatPeriods(slots) == "start: 2024-01-01 09:00:00, end: 2024-01-01 10:00:00, duration: 1h 0m\n "
                                      "start: 2024-01-01 12:00:00, end: 2024-01-01 13:00:00, duration: 1h 0m\n "
                                      "start: 2024-01-01 14:00:00, end: 2024-01-01 15:00:00, duration: 1h 0m");
        CHECK(formatPeriods(std::vector<Slot>()) == "");
    }
}

} // namespace chronoslots
