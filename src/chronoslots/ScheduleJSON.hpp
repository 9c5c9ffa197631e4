#ifndef SRC_CHRONOSLOTS_SCHEDULE_JSON_HPP_
#define SRC_CHRONOSLOTS_SCHEDULE_JSON_HPP_

#include "chronoslots/Instant.hpp"
#include "chronoslots/ScheduleRecords.hpp"

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace chronoslots {

// Reads schedule documents and writes search results as JSON. Instants are integer seconds since the epoch.
//
// Input:  {"span": {"start": 0, "end": 28800}, "events": [{"start": 3600, "end": 7200, "name": "standup"}]}
// Output: {"slots": [{"start": 0, "end": 3600, "duration": 3600}]}
//
// The "duration" key holds the exact unsigned number of seconds in each slot.
//
// The "span" object and the event "name" keys are optional. Event ranges are not validated here, that happens when
// they are converted to Blocks. To avoid copying strings around the output is accessed via the json() accessor.
class ScheduleJSON {
public:
    ScheduleJSON();
    ~ScheduleJSON();

    // Returns false and logs the reason if |json| is malformed or doesn't match the expected shape.
    bool parse(std::string_view json);

    const std::optional<Instant>& spanStart() const;
    const std::optional<Instant>& spanEnd() const;
    const std::vector<ScheduledEvent>& events() const;

    void dump(const std::vector<AvailableSlot>& slots, bool prettyPrint);

    std::string_view json() const;

private:
    // pImpl pattern to protect including headers from contaminating json
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace chronoslots

#endif // SRC_CHRONOSLOTS_SCHEDULE_JSON_HPP_
