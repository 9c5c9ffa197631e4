#include "chronoslots/ScheduleJSON.hpp"

#include "rapidjson/document.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"
#include "spdlog/spdlog.h"

namespace chronoslots {

class ScheduleJSON::Impl {
public:
    ~Impl() = default;

    bool parse(std::string_view json) {
        m_spanStart.reset();
        m_spanEnd.reset();
        m_events.clear();

        rapidjson::Document document;
        rapidjson::ParseResult parseResult = document.Parse(json.data(), json.size());
        if (!parseResult) {
            SPDLOG_ERROR("Failed to parse schedule JSON at offset {}.", parseResult.Offset());
            return false;
        }
        if (!document.IsObject()) {
            SPDLOG_ERROR("Schedule JSON is not a JSON object.");
            return false;
        }

        if (document.HasMember("span")) {
            const rapidjson::Value& span = document["span"];
            if (!span.IsObject()) {
                SPDLOG_ERROR("Schedule 'span' key is not an object.");
                return false;
            }
            Instant start, end;
            if (!decodeInstant(span, "start", "span", start)) { return false; }
            if (!decodeInstant(span, "end", "span", end)) { return false; }
            m_spanStart = start;
            m_spanEnd = end;
        }

        if (!document.HasMember("events")) {
            SPDLOG_ERROR("Schedule JSON missing 'events' key.");
            return false;
        }
        const rapidjson::Value& events = document["events"];
        if (!events.IsArray()) {
            SPDLOG_ERROR("Schedule 'events' key is not an array.");
            return false;
        }
        m_events.reserve(events.Size());
        for (rapidjson::SizeType i = 0; i < events.Size(); ++i) {
            const rapidjson::Value& event = events[i];
            if (!event.IsObject()) {
                SPDLOG_ERROR("Schedule event {} is not an object.", i);
                return false;
            }
            Instant start, end;
            if (!decodeInstant(event, "start", "event", start)) { return false; }
            if (!decodeInstant(event, "end", "event", end)) { return false; }
            std::string name;
            if (event.HasMember("name")) {
                if (!event["name"].IsString()) {
                    SPDLOG_ERROR("Schedule event {} 'name' key is not a string.", i);
                    return false;
                }
                name = std::string(event["name"].GetString(), event["name"].GetStringLength());
            }
            m_events.emplace_back(ScheduledEvent(start, end, std::move(name)));
        }

        SPDLOG_DEBUG("Parsed schedule with {} events.", m_events.size());
        return true;
    }

    void dump(const std::vector<AvailableSlot>& slots, bool prettyPrint) {
        rapidjson::Document document;
        auto& alloc = document.GetAllocator();
        document.SetObject();

        rapidjson::Value slotArray;
        slotArray.SetArray();
        slotArray.Reserve(static_cast<rapidjson::SizeType>(slots.size()), alloc);
        for (const auto& slot : slots) {
            rapidjson::Value slotObject;
            slotObject.SetObject();
            slotObject.AddMember("start", rapidjson::Value(secondsSinceEpoch(slot.start())), alloc);
            slotObject.AddMember("end", rapidjson::Value(secondsSinceEpoch(slot.end())), alloc);
            slotObject.AddMember("duration", rapidjson::Value(elapsedSeconds(slot.start(), slot.end())), alloc);
            slotArray.PushBack(slotObject, alloc);
        }
        document.AddMember("slots", slotArray, alloc);

        m_buffer.Clear();
        if (prettyPrint) {
            rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(m_buffer);
            document.Accept(writer);
        } else {
            rapidjson::Writer<rapidjson::StringBuffer> writer(m_buffer);
            document.Accept(writer);
        }
    }

    const std::optional<Instant>& spanStart() const { return m_spanStart; }
    const std::optional<Instant>& spanEnd() const { return m_spanEnd; }
    const std::vector<ScheduledEvent>& events() const { return m_events; }

    std::string_view json() const { return std::string_view(m_buffer.GetString(), m_buffer.GetSize()); }

private:
    bool decodeInstant(const rapidjson::Value& object, const char* key, const char* objectName, Instant& instant) {
        if (!object.HasMember(key)) {
            SPDLOG_ERROR("Schedule {} missing '{}' key.", objectName, key);
            return false;
        }
        const rapidjson::Value& value = object[key];
        if (!value.IsInt64()) {
            SPDLOG_ERROR("Schedule {} '{}' key is not an integer number of seconds.", objectName, key);
            return false;
        }
        instant = makeInstant(value.GetInt64());
        return true;
    }

    std::optional<Instant> m_spanStart;
    std::optional<Instant> m_spanEnd;
    std::vector<ScheduledEvent> m_events;
    rapidjson::StringBuffer m_buffer;
};

ScheduleJSON::ScheduleJSON(): m_impl(std::make_unique<ScheduleJSON::Impl>()) {}

ScheduleJSON::~ScheduleJSON() {}

bool ScheduleJSON::parse(std::string_view json) { return m_impl->parse(json); }

const std::optional<Instant>& ScheduleJSON::spanStart() const { return m_impl->spanStart(); }

const std::optional<Instant>& ScheduleJSON::spanEnd() const { return m_impl->spanEnd(); }

const std::vector<ScheduledEvent>& ScheduleJSON::events() const { return m_impl->events(); }

void ScheduleJSON::dump(const std::vector<AvailableSlot>& slots, bool prettyPrint) {
    m_impl->dump(slots, prettyPrint);
}

std::string_view ScheduleJSON::json() const { return m_impl->json(); }

} // namespace chronoslots
