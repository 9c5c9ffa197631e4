#include "chronoslots/Finder.hpp"

#include "chronoslots/Capabilities.hpp"
#include "chronoslots/ErrorReporter.hpp"
#include "chronoslots/PeriodTestFixture.hpp"
#include "chronoslots/ScheduleRecords.hpp"
#include "chronoslots/Validator.hpp"

#include "doctest/doctest.h"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <random>
#include <utility>
#include <vector>

namespace {

// Stand-ins for caller record types.
struct TestEvent {
    chronoslots::Instant startAt;
    chronoslots::Instant endAt;

    chronoslots::Instant start() const { return startAt; }
    chronoslots::Instant end() const { return endAt; }
    std::optional<chronoslots::Block> toBlock(chronoslots::ErrorReporter* errorReporter) const {
        return chronoslots::Block::make(startAt, endAt, errorReporter);
    }
};

struct TestSlot {
    chronoslots::Instant startAt;
    chronoslots::Instant endAt;

    chronoslots::Instant start() const { return startAt; }
    chronoslots::Instant end() const { return endAt; }
    static TestSlot makeFromSlot(const chronoslots::Slot& slot) { return TestSlot{slot.start(), slot.end()}; }
};

struct NotARecord {
    int start;
};

} // namespace

namespace chronoslots {

static_assert(IsPeriod<Block>::value);
static_assert(IsPeriod<TestEvent>::value);
static_assert(!IsPeriod<NotARecord>::value);
static_assert(IsInput<TestEvent>::value);
static_assert(!IsInput<TestSlot>::value);
static_assert(IsOutput<TestSlot>::value);
static_assert(!IsOutput<TestEvent>::value);

class FinderTestFixture : public PeriodTestFixture {
public:
    FinderTestFixture() = default;
    virtual ~FinderTestFixture() = default;

protected:
    static TestEvent event(int64_t from, int64_t to) { return TestEvent{hours(from), hours(to)}; }

    // Runs a search and compares the results against |expected| hour offsets.
    static void checkFind(const Span& searchSpan, const std::vector<TestEvent>& events,
            const std::vector<std::pair<int64_t, int64_t>>& expected) {
        ErrorReporter er(true);
        auto slots = find<TestSlot>(searchSpan, events, &er);
        REQUIRE(slots);
        CHECK(er.ok());
        REQUIRE(slots->size() == expected.size());
        for (size_t i = 0; i < expected.size(); ++i) {
            CHECK(slots->at(i).start() == hours(expected[i].first));
            CHECK(slots->at(i).end() == hours(expected[i].second));
        }
    }
};

TEST_CASE_FIXTURE(FinderTestFixture, "find single block") {
    SUBCASE("no blocks") { checkFind(span(0, 8), {}, {{0, 8}}); }
    SUBCASE("block before span") { checkFind(span(0, 8), {event(-2, -1)}, {{0, 8}}); }
    SUBCASE("block ends at span start") { checkFind(span(0, 8), {event(-1, 0)}, {{0, 8}}); }
    SUBCASE("block overlaps span start") { checkFind(span(0, 8), {event(-1, 2)}, {{2, 8}}); }
    SUBCASE("block starts with span") { checkFind(span(0, 8), {event(0, 1)}, {{1, 8}}); }
    SUBCASE("block inside span") { checkFind(span(0, 8), {event(1, 5)}, {{0, 1}, {5, 8}}); }
    SUBCASE("block equals span") { checkFind(span(0, 8), {event(0, 8)}, {}); }
    SUBCASE("block contains span") { checkFind(span(0, 8), {event(-1, 9)}, {}); }
    SUBCASE("block ends with span") { checkFind(span(0, 8), {event(3, 8)}, {{0, 3}}); }
    SUBCASE("block overlaps span end") { checkFind(span(0, 8), {event(3, 9)}, {{0, 3}}); }
    SUBCASE("block starts at span end") { checkFind(span(0, 8), {event(8, 10)}, {{0, 8}}); }
    SUBCASE("block after span") { checkFind(span(0, 8), {event(9, 10)}, {{0, 8}}); }
}

TEST_CASE_FIXTURE(FinderTestFixture, "find multiple blocks") {
    SUBCASE("two blocks inside span") {
        checkFind(span(0, 8), {event(1, 2), event(6, 7)}, {{0, 1}, {2, 6}, {7, 8}});
    }
    SUBCASE("two overlapping blocks inside span") {
        checkFind(span(0, 8), {event(1, 4), event(2, 5)}, {{0, 1}, {5, 8}});
    }
    SUBCASE("overlap merge example") {
        checkFind(span(0, 10), {event(1, 3), event(2, 5)}, {{0, 1}, {5, 10}});
    }
    SUBCASE("disjoint busy example") {
        checkFind(span(0, 8), {event(1, 2), event(3, 4)}, {{0, 1}, {2, 3}, {4, 8}});
    }
    SUBCASE("out of span blocks are ignored") {
        checkFind(span(2, 6), {event(0, 1), event(7, 9)}, {{2, 6}});
    }
    SUBCASE("unsorted input") {
        checkFind(span(0, 10), {event(7, 8), event(1, 2), event(4, 5)}, {{0, 1}, {2, 4}, {5, 7}, {8, 10}});
    }
    SUBCASE("touching blocks leave no zero length slot") {
        checkFind(span(0, 8), {event(2, 3), event(3, 4)}, {{0, 2}, {4, 8}});
    }
    SUBCASE("nested blocks") {
        checkFind(span(0, 8), {event(1, 6), event(2, 3), event(4, 5)}, {{0, 1}, {6, 8}});
    }
    SUBCASE("blocks cover span together") {
        checkFind(span(0, 8), {event(-1, 3), event(3, 5), event(4, 9)}, {});
    }
    SUBCASE("blocks straddle both ends") {
        checkFind(span(0, 8), {event(-2, 1), event(7, 12)}, {{1, 7}});
    }
}

TEST_CASE_FIXTURE(FinderTestFixture, "find conversion failure") {
    ErrorReporter er(true);
    std::vector<TestEvent> events{event(1, 2), event(5, 3), event(6, 7)};
    auto slots = find<TestSlot>(span(0, 8), events, &er);
    CHECK(!slots);
    REQUIRE(er.errorCount() == 1);
    CHECK(er.errors().front().kind == PeriodError::kInvalidRange);

    SUBCASE("zero length event") {
        er.clear();
        std::vector<TestEvent> zeroLength{event(4, 4)};
        CHECK(!find<TestSlot>(span(0, 8), zeroLength, &er));
        CHECK(er.errorCount() == 1);
    }
}

TEST_CASE_FIXTURE(FinderTestFixture, "findSlots with Blocks") {
    auto slots = findSlots(span(0, 8), std::vector<Block>{block(6, 7), block(1, 2)});
    REQUIRE(slots.size() == 3);
    CHECK(slots[0] == slot(0, 1));
    CHECK(slots[1] == slot(2, 6));
    CHECK(slots[2] == slot(7, 8));

    auto busy = BlockSet::normalize({block(0, 4)});
    auto fromSet = findSlots(span(0, 8), busy);
    REQUIRE(fromSet.size() == 1);
    CHECK(fromSet[0] == slot(4, 8));
}

TEST_CASE_FIXTURE(FinderTestFixture, "find at extreme instants") {
    SUBCASE("span far past the calendar") {
        auto farSpan = Span::make(makeInstant(0), makeInstant(int64_t(1) << 60));
        REQUIRE(farSpan);
        ErrorReporter er(true);
        auto slots = find<AvailableSlot>(*farSpan, std::vector<TestEvent>{event(10, 20)}, &er);
        REQUIRE(slots);
        CHECK(er.ok());
        REQUIRE(slots->size() == 2);
        CHECK(slots->at(0).start() == makeInstant(0));
        CHECK(slots->at(0).end() == hours(10));
        CHECK(slots->at(1).start() == hours(20));
        CHECK(slots->at(1).end() == makeInstant(int64_t(1) << 60));
    }
    SUBCASE("span wider than int64_t seconds") {
        auto lowest = makeInstant((std::numeric_limits<int64_t>::min() / 2) - 10);
        auto highest = makeInstant((std::numeric_limits<int64_t>::max() / 2) + 10);
        auto wideSpan = Span::make(lowest, highest);
        REQUIRE(wideSpan);
        auto slots = findSlots(*wideSpan, BlockSet());
        REQUIRE(slots.size() == 1);
        CHECK(slots[0].start() == lowest);
        CHECK(slots[0].end() == highest);
        CHECK(slots[0].duration() == Duration(std::numeric_limits<int64_t>::max()));
    }
    SUBCASE("inverted event at extreme instants") {
        ErrorReporter er(true);
        std::vector<TestEvent> events{TestEvent{makeInstant(std::numeric_limits<int64_t>::max()),
                makeInstant(std::numeric_limits<int64_t>::min())}};
        CHECK(!find<TestSlot>(span(0, 8), events, &er));
        REQUIRE(er.errorCount() == 1);
        CHECK(er.errors().front().kind == PeriodError::kInvalidRange);
    }
}

// Free slots and the busy time inside the span must always partition the span exactly.
TEST_CASE_FIXTURE(FinderTestFixture, "findSlots coverage sweep") {
    std::mt19937 generator(1234);
    std::uniform_int_distribution<int64_t> offsets(-20, 40);
    std::uniform_int_distribution<int> counts(0, 12);

    for (int trial = 0; trial < 500; ++trial) {
        int64_t a = offsets(generator);
        int64_t b = offsets(generator);
        if (a == b) {
            continue;
        }
        auto searchSpan = span(std::min(a, b), std::max(a, b));

        std::vector<Block> blocks;
        int count = counts(generator);
        for (int i = 0; i < count; ++i) {
            int64_t from = offsets(generator);
            int64_t to = offsets(generator);
            if (from == to) {
                continue;
            }
            blocks.emplace_back(block(std::min(from, to), std::max(from, to)));
        }

        auto busy = BlockSet::normalize(blocks);
        REQUIRE(Validator::validateBlockSet(busy));
        auto slots = findSlots(searchSpan, busy);
        REQUIRE(Validator::validateSlots(searchSpan, busy, slots));

        // Every hour of the span is free exactly when no Block covers it.
        size_t slotIndex = 0;
        for (int64_t h = std::min(a, b); h < std::max(a, b); ++h) {
            while (slotIndex < slots.size() && slots[slotIndex].end() <= hours(h)) {
                ++slotIndex;
            }
            bool isFree = slotIndex < slots.size() && slots[slotIndex].start() <= hours(h);
            CHECK(isFree == !busy.covers(hours(h)));
        }
    }
}

} // namespace chronoslots
