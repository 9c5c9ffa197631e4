#include "chronoslots/LogLevel.hpp"

#include "doctest/doctest.h"

namespace chronoslots {

TEST_CASE("parseLogLevel") {
    spdlog::level::level_enum level = spdlog::level::info;

    SUBCASE("full names") {
        REQUIRE(parseLogLevel("trace", level));
        CHECK(level == spdlog::level::trace);
        REQUIRE(parseLogLevel("warning", level));
        CHECK(level == spdlog::level::warn);
        REQUIRE(parseLogLevel("critical", level));
        CHECK(level == spdlog::level::critical);
    }
    SUBCASE("short names") {
        REQUIRE(parseLogLevel("warn", level));
        CHECK(level == spdlog::level::warn);
        REQUIRE(parseLogLevel("err", level));
        CHECK(level == spdlog::level::err);
    }
    SUBCASE("off") {
        REQUIRE(parseLogLevel("off", level));
        CHECK(level == spdlog::level::off);
    }
    SUBCASE("unknown names leave the level alone") {
        CHECK(!parseLogLevel("wran", level));
        CHECK(!parseLogLevel("", level));
        CHECK(!parseLogLevel("Debug", level));
        CHECK(level == spdlog::level::info);
    }
}

} // namespace chronoslots
