#include "chronoslots/Validator.hpp"

#include "chronoslots/PeriodTestFixture.hpp"

#include "doctest/doctest.h"

#include <vector>

namespace chronoslots {

TEST_CASE_FIXTURE(PeriodTestFixture, "Validator validateBlockSet") {
    CHECK(Validator::validateBlockSet(BlockSet()));
    CHECK(Validator::validateBlockSet(BlockSet::normalize({block(0, 1), block(1, 3), block(5, 6)})));
}

TEST_CASE_FIXTURE(PeriodTestFixture, "Validator validateSlots") {
    auto busy = BlockSet::normalize({block(1, 2), block(4, 5)});

    SUBCASE("correct slots") {
        CHECK(Validator::validateSlots(span(0, 8), busy, {slot(0, 1), slot(2, 4), slot(5, 8)}));
    }
    SUBCASE("no busy time") {
        CHECK(Validator::validateSlots(span(0, 8), BlockSet(), {slot(0, 8)}));
    }
    SUBCASE("fully busy") {
        CHECK(Validator::validateSlots(span(1, 2), busy, {}));
    }
    SUBCASE("unsorted slots") {
        CHECK(!Validator::validateSlots(span(0, 8), busy, {slot(2, 4), slot(0, 1), slot(5, 8)}));
    }
    SUBCASE("adjacent slots") {
        CHECK(!Validator::validateSlots(span(0, 8), BlockSet(), {slot(0, 4), slot(4, 8)}));
    }
    SUBCASE("slot outside span") {
        CHECK(!Validator::validateSlots(span(0, 8), busy, {slot(0, 1), slot(2, 4), slot(5, 9)}));
    }
    SUBCASE("slot overlaps busy time") {
        CHECK(!Validator::validateSlots(span(0, 8), busy, {slot(0, 2), slot(3, 4), slot(5, 8)}));
    }
    SUBCASE("missing free time") {
        CHECK(!Validator::validateSlots(span(0, 8), busy, {slot(0, 1), slot(5, 8)}));
        CHECK(!Validator::validateSlots(span(0, 8), busy, {slot(0, 1), slot(2, 4)}));
    }
}

} // namespace chronoslots
