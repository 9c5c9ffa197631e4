#include "chronoslots/Span.hpp"

#include "chronoslots/PeriodTestFixture.hpp"

#include "doctest/doctest.h"

namespace chronoslots {

TEST_CASE_FIXTURE(PeriodTestFixture, "Span clip") {
    SUBCASE("block inside") {
        auto clipped = span(0, 8).clip(block(2, 3));
        REQUIRE(clipped);
        CHECK(*clipped == block(2, 3));
    }
    SUBCASE("block straddles start") {
        auto clipped = span(2, 8).clip(block(0, 3));
        REQUIRE(clipped);
        CHECK(*clipped == block(2, 3));
    }
    SUBCASE("block straddles end") {
        auto clipped = span(0, 8).clip(block(6, 12));
        REQUIRE(clipped);
        CHECK(*clipped == block(6, 8));
    }
    SUBCASE("block covers span") {
        auto clipped = span(2, 6).clip(block(0, 10));
        REQUIRE(clipped);
        CHECK(*clipped == block(2, 6));
    }
    SUBCASE("block outside") {
        CHECK(!span(2, 6).clip(block(0, 1)));
        CHECK(!span(2, 6).clip(block(7, 9)));
        CHECK(!span(2, 6).clip(block(0, 2)));
        CHECK(!span(2, 6).clip(block(6, 9)));
    }
}

TEST_CASE_FIXTURE(PeriodTestFixture, "Span toSlot") {
    CHECK(span(0, 8).toSlot() == slot(0, 8));
    CHECK(span(-3, 5).toSlot() == slot(-3, 5));
}

} // namespace chronoslots
