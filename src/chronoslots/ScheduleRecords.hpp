#ifndef SRC_CHRONOSLOTS_SCHEDULE_RECORDS_HPP_
#define SRC_CHRONOSLOTS_SCHEDULE_RECORDS_HPP_

#include "chronoslots/Block.hpp"
#include "chronoslots/ErrorReporter.hpp"
#include "chronoslots/Instant.hpp"
#include "chronoslots/Slot.hpp"

#include <optional>
#include <string>
#include <utility>

namespace chronoslots {

// A busy event read from a schedule file. Its range is unchecked until converted to a Block.
class ScheduledEvent {
public:
    ScheduledEvent(Instant startAt, Instant endAt, std::string name = std::string()):
        m_startAt(startAt), m_endAt(endAt), m_name(std::move(name)) {}
    ~ScheduledEvent() = default;

    Instant start() const { return m_startAt; }
    Instant end() const { return m_endAt; }
    const std::string& name() const { return m_name; }

    std::optional<Block> toBlock(ErrorReporter* errorReporter) const {
        return Block::make(m_startAt, m_endAt, errorReporter);
    }

private:
    Instant m_startAt;
    Instant m_endAt;
    std::string m_name;
};

// A free period reported back from a search.
class AvailableSlot {
public:
    static AvailableSlot makeFromSlot(const Slot& slot) { return AvailableSlot(slot.start(), slot.end()); }
    ~AvailableSlot() = default;

    Instant start() const { return m_startAt; }
    Instant end() const { return m_endAt; }
    Duration duration() const { return elapsed(m_startAt, m_endAt); }

private:
    AvailableSlot(Instant startAt, Instant endAt): m_startAt(startAt), m_endAt(endAt) {}

    Instant m_startAt;
    Instant m_endAt;
};

} // namespace chronoslots

#endif // SRC_CHRONOSLOTS_SCHEDULE_RECORDS_HPP_
