#include "chronoslots/Block.hpp"

#include "chronoslots/PeriodTestFixture.hpp"
#include "chronoslots/Span.hpp"

#include "doctest/doctest.h"

namespace chronoslots {

TEST_CASE_FIXTURE(PeriodTestFixture, "Block relations") {
    SUBCASE("contains") {
        CHECK(block(0, 8).contains(span(1, 7)));
        CHECK(block(0, 8).contains(span(0, 8)));
        CHECK(!block(9, 12).contains(span(0, 8)));
        CHECK(!block(10, 12).contains(span(0, 8)));
        CHECK(!block(1, 7).contains(span(0, 8)));
    }
    SUBCASE("isContainedIn") {
        CHECK(block(1, 7).isContainedIn(span(0, 8)));
        CHECK(block(0, 8).isContainedIn(span(0, 8)));
        CHECK(!block(0, 4).isContainedIn(span(5, 7)));
        CHECK(!block(7, 8).isContainedIn(span(5, 6)));
    }
    SUBCASE("overlapsAtStart") {
        CHECK(block(1, 5).overlapsAtStart(span(4, 8)));
        CHECK(block(1, 4).overlapsAtStart(span(4, 8)));
        CHECK(!block(1, 5).overlapsAtStart(span(6, 8)));
        CHECK(!block(5, 6).overlapsAtStart(span(4, 8)));
    }
    SUBCASE("overlapsAtEnd") {
        CHECK(block(10, 20).overlapsAtEnd(span(5, 15)));
        CHECK(block(15, 20).overlapsAtEnd(span(5, 15)));
        CHECK(!block(10, 20).overlapsAtEnd(span(0, 8)));
        CHECK(!block(6, 7).overlapsAtEnd(span(5, 15)));
    }
    SUBCASE("intersects") {
        CHECK(block(1, 5).intersects(span(4, 8)));
        CHECK(block(0, 10).intersects(span(4, 8)));
        CHECK(block(5, 6).intersects(span(4, 8)));
        // Touching at an endpoint shares no time.
        CHECK(!block(1, 4).intersects(span(4, 8)));
        CHECK(!block(8, 9).intersects(span(4, 8)));
        CHECK(!block(10, 12).intersects(span(4, 8)));
    }
}

} // namespace chronoslots
