#include "chronoslots/Slot.hpp"

#include "chronoslots/ErrorReporter.hpp"
#include "chronoslots/PeriodTestFixture.hpp"

#include "doctest/doctest.h"

namespace chronoslots {

TEST_CASE_FIXTURE(PeriodTestFixture, "Slot makeBetween") {
    SUBCASE("block starts inside span") {
        auto s = Slot::makeBetween(span(0, 8), block(4, 9));
        REQUIRE(s);
        CHECK(*s == slot(0, 4));
    }
    SUBCASE("block starts after span") {
        auto s = Slot::makeBetween(span(0, 8), block(10, 12));
        REQUIRE(s);
        CHECK(*s == slot(0, 10));
    }
    SUBCASE("span starts after block") {
        ErrorReporter er(true);
        CHECK(!Slot::makeBetween(span(4, 8), block(1, 5), &er));
        REQUIRE(er.errorCount() == 1);
        CHECK(er.errors().front().kind == PeriodError::kInvalidRange);
    }
    SUBCASE("block starts with span") {
        ErrorReporter er(true);
        CHECK(!Slot::makeBetween(span(4, 8), block(4, 5), &er));
        CHECK(er.errorCount() == 1);
    }
}

} // namespace chronoslots
