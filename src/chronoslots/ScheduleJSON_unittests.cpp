#include "chronoslots/ScheduleJSON.hpp"

#include "chronoslots/ErrorReporter.hpp"
#include "chronoslots/Finder.hpp"
#include "chronoslots/Span.hpp"

#include "doctest/doctest.h"

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace chronoslots {

TEST_CASE("ScheduleJSON parse") {
    SUBCASE("span and events") {
        ScheduleJSON schedule;
        REQUIRE(schedule.parse(R"({"span": {"start": 0, "end": 28800},
                "events": [{"start": 3600, "end": 7200, "name": "standup"}, {"start": 10800, "end": 14400}]})"));
        REQUIRE(schedule.spanStart());
        REQUIRE(schedule.spanEnd());
        CHECK(*schedule.spanStart() == makeInstant(0));
        CHECK(*schedule.spanEnd() == makeInstant(28800));
        REQUIRE(schedule.events().size() == 2);
        CHECK(schedule.events()[0].start() == makeInstant(3600));
        CHECK(schedule.events()[0].end() == makeInstant(7200));
        CHECK(schedule.events()[0].name() == "standup");
        CHECK(schedule.events()[1].start() == makeInstant(10800));
        CHECK(schedule.events()[1].name().empty());
    }
    SUBCASE("span is optional") {
        ScheduleJSON schedule;
        REQUIRE(schedule.parse(R"({"events": []})"));
        CHECK(!schedule.spanStart());
        CHECK(!schedule.spanEnd());
        CHECK(schedule.events().empty());
    }
    SUBCASE("inverted events parse, conversion rejects them") {
        ScheduleJSON schedule;
        REQUIRE(schedule.parse(R"({"events": [{"start": 100, "end": 50}]})"));
        ErrorReporter er(true);
        CHECK(!schedule.events()[0].toBlock(&er));
        CHECK(er.errorCount() == 1);
    }
    SUBCASE("reparse replaces contents") {
        ScheduleJSON schedule;
        REQUIRE(schedule.parse(R"({"span": {"start": 0, "end": 10}, "events": [{"start": 1, "end": 2}]})"));
        REQUIRE(schedule.parse(R"({"events": []})"));
        CHECK(!schedule.spanStart());
        CHECK(schedule.events().empty());
    }
    SUBCASE("malformed input") {
        ScheduleJSON schedule;
        CHECK(!schedule.parse("{\"events\": ["));
        CHECK(!schedule.parse("[]"));
        CHECK(!schedule.parse(R"({"span": {"start": 0, "end": 10}})"));
        CHECK(!schedule.parse(R"({"events": {}})"));
        CHECK(!schedule.parse(R"({"events": [5]})"));
        CHECK(!schedule.parse(R"({"events": [{"start": 1}]})"));
        CHECK(!schedule.parse(R"({"events": [{"start": "1", "end": 2}]})"));
        CHECK(!schedule.parse(R"({"events": [{"start": 1.5, "end": 2}]})"));
        CHECK(!schedule.parse(R"({"events": [{"start": 1, "end": 2, "name": 7}]})"));
        CHECK(!schedule.parse(R"({"span": [0, 10], "events": []})"));
        CHECK(!schedule.parse(R"({"span": {"start": 0}, "events": []})"));
    }
}

TEST_CASE("ScheduleJSON dump") {
    ScheduleJSON schedule;
    REQUIRE(schedule.parse(R"({"span": {"start": 0, "end": 28800},
            "events": [{"start": 3600, "end": 7200}, {"start": 10800, "end": 14400}]})"));
    auto span = Span::make(*schedule.spanStart(), *schedule.spanEnd());
    REQUIRE(span);
    auto slots = find<AvailableSlot>(*span, schedule.events());
    REQUIRE(slots);

    SUBCASE("compact") {
        schedule.dump(*slots, false);
        CHECK(std::string(schedule.json())
              == "{\"slots\":[{\"start\":0,\"end\":3600,\"duration\":3600},"
                 "{\"start\":7200,\"end\":10800,\"duration\":3600},"
                 "{\"start\":14400,\"end\":28800,\"duration\":14400}]}");
    }
    SUBCASE("duration wider than int64_t") {
        auto wide = Span::make(makeInstant(std::numeric_limits<int64_t>::min()),
                makeInstant(std::numeric_limits<int64_t>::max()));
        REQUIRE(wide);
        auto wideSlots = find<AvailableSlot>(*wide, std::vector<ScheduledEvent>());
        REQUIRE(wideSlots);
        schedule.dump(*wideSlots, false);
        CHECK(std::string(schedule.json())
              == "{\"slots\":[{\"start\":-9223372036854775808,\"end\":9223372036854775807,"
                 "\"duration\":18446744073709551615}]}");
    }
    SUBCASE("pretty") {
        schedule.dump(std::vector<AvailableSlot>(), true);
        CHECK(std::string(schedule.json()) == "{\n    \"slots\": []\n}");
    }
}

} // namespace chronoslots
