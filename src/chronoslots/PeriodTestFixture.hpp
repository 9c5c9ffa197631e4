#ifndef SRC_CHRONOSLOTS_PERIOD_TEST_FIXTURE_HPP_
#define SRC_CHRONOSLOTS_PERIOD_TEST_FIXTURE_HPP_

#include "chronoslots/Block.hpp"
#include "chronoslots/Instant.hpp"
#include "chronoslots/Slot.hpp"
#include "chronoslots/Span.hpp"

#include "doctest/doctest.h"

// For consumption by unittests only, a test fixture that builds periods at whole hour offsets from a fixed instant.
namespace chronoslots {

class PeriodTestFixture {
public:
    PeriodTestFixture() = default;
    virtual ~PeriodTestFixture() = default;

protected:
    // 2024-01-01 09:00:00 UTC
    static constexpr int64_t kBaseSeconds = 1704099600;

    static Instant hours(int64_t h) { return makeInstant(kBaseSeconds + (h * 3600)); }

    static Block block(int64_t from, int64_t to) {
        auto b = Block::make(hours(from), hours(to));
        REQUIRE(b);
        return *b;
    }
    static Span span(int64_t from, int64_t to) {
        auto s = Span::make(hours(from), hours(to));
        REQUIRE(s);
        return *s;
    }
    static Slot slot(int64_t from, int64_t to) {
        auto s = Slot::make(hours(from), hours(to));
        REQUIRE(s);
        return *s;
    }
};

} // namespace chronoslots

#endif // SRC_CHRONOSLOTS_PERIOD_TEST_FIXTURE_HPP_
