#ifndef SRC_CHRONOSLOTS_PERIOD_HPP_
#define SRC_CHRONOSLOTS_PERIOD_HPP_

#include "chronoslots/ErrorReporter.hpp"
#include "chronoslots/Instant.hpp"

#include <optional>
#include <string>
#include <vector>

namespace chronoslots {

// Renders a time range as "start: <instant>, end: <instant>, duration: <hours>h <minutes>m".
std::string formatRange(Instant start, Instant end);

// Works with any type offering start() and end(), including caller record types.
template <typename P> std::string formatPeriod(const P& period) { return formatRange(period.start(), period.end()); }

// One rendering per element, joined with "\n ".
template <typename P> std::string formatPeriods(const std::vector<P>& periods) {
    std::string result;
    for (size_t i = 0; i < periods.size(); ++i) {
        if (i > 0) {
            result += "\n ";
        }
        result += formatPeriod(periods[i]);
    }
    return result;
}

// Common base for the half-open time ranges [start, end) used by the finder: Block, Span and Slot. Uses the Curious
// Recurring Template Pattern so that each derived type shares the validating factory and the accessors while
// remaining a distinct type, so a Slot can never be passed where a Block is expected. Derived types keep their
// constructors private and befriend Period<T>, which makes make() the only way to build one from raw instants.
template <typename T> class Period {
public:
    // Returns the period if |start| is strictly before |end|. Otherwise reports kInvalidRange to |errorReporter|, if
    // provided, and returns std::nullopt.
    static std::optional<T> make(Instant start, Instant end, ErrorReporter* errorReporter = nullptr) {
        if (start >= end) {
            if (errorReporter) {
                errorReporter->addInvalidRangeError(start, end);
            }
            return std::nullopt;
        }
        return T(start, end);
    }

    Instant start() const { return m_start; }
    Instant end() const { return m_end; }
    Duration duration() const { return elapsed(m_start, m_end); }

    std::string toString() const { return formatRange(m_start, m_end); }

    // Periods order by start time, then by end time.
    bool operator==(const T& p) const { return m_start == p.start() && m_end == p.end(); }
    bool operator!=(const T& p) const { return !(*this == p); }
    bool operator<(const T& p) const { return m_start < p.start() || (m_start == p.start() && m_end < p.end()); }

protected:
    Period(Instant start, Instant end): m_start(start), m_end(end) {}
    ~Period() = default;

    Instant m_start;
    Instant m_end;
};

} // namespace chronoslots

#endif // SRC_CHRONOSLOTS_PERIOD_HPP_
