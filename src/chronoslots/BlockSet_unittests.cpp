#include "chronoslots/BlockSet.hpp"

#include "chronoslots/PeriodTestFixture.hpp"

#include "doctest/doctest.h"

#include <vector>

namespace chronoslots {

TEST_CASE_FIXTURE(PeriodTestFixture, "BlockSet normalize") {
    SUBCASE("empty") {
        auto bs = BlockSet::normalize(std::vector<Block>());
        CHECK(bs.isEmpty());
        CHECK(bs.size() == 0);
    }
    SUBCASE("single block unchanged") {
        auto bs = BlockSet::normalize({block(3, 5)});
        REQUIRE(bs.size() == 1);
        CHECK(bs.blocks()[0] == block(3, 5));
    }
    SUBCASE("sorts disjoint blocks") {
        auto bs = BlockSet::normalize({block(8, 10), block(0, 1), block(4, 5), block(2, 3), block(6, 7)});
        REQUIRE(bs.size() == 5);
        CHECK(bs.blocks()[0] == block(0, 1));
        CHECK(bs.blocks()[1] == block(2, 3));
        CHECK(bs.blocks()[2] == block(4, 5));
        CHECK(bs.blocks()[3] == block(6, 7));
        CHECK(bs.blocks()[4] == block(8, 10));
        CHECK(bs.startTime() == hours(0));
        CHECK(bs.endTime() == hours(10));
    }
    SUBCASE("overlapping blocks merge") {
        auto bs = BlockSet::normalize({block(2, 5), block(1, 3)});
        REQUIRE(bs.size() == 1);
        CHECK(bs.blocks()[0] == block(1, 5));
    }
    SUBCASE("touching blocks merge") {
        auto bs = BlockSet::normalize({block(3, 4), block(1, 2), block(2, 3)});
        REQUIRE(bs.size() == 1);
        CHECK(bs.blocks()[0] == block(1, 4));
    }
    SUBCASE("nested blocks collapse into the outer one") {
        auto bs = BlockSet::normalize({block(49, 51), block(47, 53), block(48, 49), block(1, 100), block(99, 100)});
        REQUIRE(bs.size() == 1);
        CHECK(bs.blocks()[0] == block(1, 100));
    }
    SUBCASE("duplicates collapse") {
        auto bs = BlockSet::normalize({block(1, 2), block(1, 2), block(1, 2)});
        REQUIRE(bs.size() == 1);
        CHECK(bs.blocks()[0] == block(1, 2));
    }
    SUBCASE("same start, longer end wins") {
        auto bs = BlockSet::normalize({block(0, 9), block(0, 2), block(10, 11)});
        REQUIRE(bs.size() == 2);
        CHECK(bs.blocks()[0] == block(0, 9));
        CHECK(bs.blocks()[1] == block(10, 11));
    }
    SUBCASE("right expansion") {
        auto bs = BlockSet::normalize({block(0, 5), block(10, 15), block(20, 25), block(30, 35), block(40, 45),
                block(13, 17), block(31, 39), block(22, 28), block(40, 50), block(4, 6)});
        REQUIRE(bs.size() == 5);
        CHECK(bs.blocks()[0] == block(0, 6));
        CHECK(bs.blocks()[1] == block(10, 17));
        CHECK(bs.blocks()[2] == block(20, 28));
        CHECK(bs.blocks()[3] == block(30, 39));
        CHECK(bs.blocks()[4] == block(40, 50));
    }
    SUBCASE("chain of overlaps") {
        auto bs = BlockSet::normalize({block(0, 2), block(1, 4), block(3, 6), block(5, 8), block(12, 13)});
        REQUIRE(bs.size() == 2);
        CHECK(bs.blocks()[0] == block(0, 8));
        CHECK(bs.blocks()[1] == block(12, 13));
    }
    SUBCASE("normalizing a normalized set changes nothing") {
        auto bs = BlockSet::normalize({block(0, 1), block(2, 4), block(6, 7)});
        auto again = BlockSet::normalize(bs.blocks());
        CHECK(again.blocks() == bs.blocks());
    }
}

TEST_CASE_FIXTURE(PeriodTestFixture, "BlockSet covers") {
    SUBCASE("empty") {
        BlockSet bs;
        CHECK(!bs.covers(hours(0)));
    }
    SUBCASE("half-open blocks") {
        auto bs = BlockSet::normalize({block(1, 3), block(5, 6)});
        CHECK(!bs.covers(hours(0)));
        CHECK(bs.covers(hours(1)));
        CHECK(bs.covers(hours(2)));
        CHECK(!bs.covers(hours(3)));
        CHECK(!bs.covers(hours(4)));
        CHECK(bs.covers(hours(5)));
        CHECK(!bs.covers(hours(6)));
        CHECK(!bs.covers(hours(7)));
    }
}

TEST_CASE_FIXTURE(PeriodTestFixture, "BlockSet findFirstIntersection") {
    auto bs = BlockSet::normalize({block(1, 3), block(5, 6), block(9, 12)});
    Instant first = hours(-100);

    SUBCASE("empty set") {
        BlockSet empty;
        CHECK(!empty.findFirstIntersection(span(0, 10), first));
        CHECK(first == hours(-100));
    }
    SUBCASE("span before all blocks") {
        CHECK(!bs.findFirstIntersection(span(-5, 1), first));
        CHECK(first == hours(-100));
    }
    SUBCASE("span after all blocks") {
        CHECK(!bs.findFirstIntersection(span(12, 20), first));
    }
    SUBCASE("span in a gap") {
        CHECK(!bs.findFirstIntersection(span(3, 5), first));
        CHECK(!bs.findFirstIntersection(span(6, 9), first));
    }
    SUBCASE("span starts before a block") {
        REQUIRE(bs.findFirstIntersection(span(4, 8), first));
        CHECK(first == hours(5));
    }
    SUBCASE("span starts within a block") {
        REQUIRE(bs.findFirstIntersection(span(2, 8), first));
        CHECK(first == hours(2));
    }
    SUBCASE("span covers everything") {
        REQUIRE(bs.findFirstIntersection(span(-10, 100), first));
        CHECK(first == hours(1));
    }
    SUBCASE("raw range") {
        REQUIRE(bs.findFirstIntersection(hours(10), hours(11), first));
        CHECK(first == hours(10));
        CHECK(!bs.findFirstIntersection(hours(11), hours(10), first));
    }
}

} // namespace chronoslots
