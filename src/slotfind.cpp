// slotfind, command line search for the free time in a schedule
#include "chronoslots/ErrorReporter.hpp"
#include "chronoslots/Finder.hpp"
#include "chronoslots/InputFile.hpp"
#include "chronoslots/LogLevel.hpp"
#include "chronoslots/Period.hpp"
#include "chronoslots/ScheduleJSON.hpp"
#include "chronoslots/ScheduleRecords.hpp"
#include "chronoslots/Span.hpp"

#include "gflags/gflags.h"
#include "spdlog/spdlog.h"

#include <iostream>
#include <optional>

DEFINE_string(input, "", "Path to the JSON schedule file listing the search span and the busy events.");
DEFINE_int64(spanStart, 0, "Start of the search span in seconds since the epoch, overrides the schedule file.");
DEFINE_int64(spanEnd, 0, "End of the search span in seconds since the epoch, overrides the schedule file.");
DEFINE_bool(prettyPrint, false, "Indent the JSON output.");
DEFINE_bool(text, false, "Print the span, events and free slots as text instead of JSON.");
DEFINE_string(logLevel, "warn", "Logging level, one of trace, debug, info, warn, error, critical, off.");

namespace {

std::optional<chronoslots::Instant> spanBound(const char* flagName, int64_t flagValue,
        const std::optional<chronoslots::Instant>& fileValue) {
    if (!gflags::GetCommandLineFlagInfoOrDie(flagName).is_default) {
        return chronoslots::makeInstant(flagValue);
    }
    return fileValue;
}

} // namespace

int main(int argc, char* argv[]) {
    gflags::SetUsageMessage("slotfind --input=schedule.json [options]");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    spdlog::level::level_enum logLevel = spdlog::level::warn;
    if (!chronoslots::parseLogLevel(FLAGS_logLevel, logLevel)) {
        std::cerr << "unknown --logLevel '" << FLAGS_logLevel << "', expected one of " << chronoslots::kLogLevelNames
                  << std::endl;
        return -1;
    }
    spdlog::default_logger()->set_level(logLevel);

    if (FLAGS_input.empty()) {
        std::cerr << "usage: slotfind --input=schedule.json [options]" << std::endl;
        return -1;
    }

    chronoslots::InputFile inputFile(FLAGS_input);
    if (!inputFile.read()) { return -1; }

    chronoslots::ScheduleJSON schedule;
    if (!schedule.parse(inputFile.contents())) { return -1; }

    auto spanStart = spanBound("spanStart", FLAGS_spanStart, schedule.spanStart());
    auto spanEnd = spanBound("spanEnd", FLAGS_spanEnd, schedule.spanEnd());
    if (!spanStart || !spanEnd) {
        std::cerr << "no search span, add a 'span' object to the schedule or pass --spanStart and --spanEnd"
                  << std::endl;
        return -1;
    }

    chronoslots::ErrorReporter errorReporter;
    auto span = chronoslots::Span::make(*spanStart, *spanEnd, &errorReporter);
    if (!span) { return -1; }

    auto slots = chronoslots::find<chronoslots::AvailableSlot>(*span, schedule.events(), &errorReporter);
    if (!slots) { return -1; }

    if (FLAGS_text) {
        std::cout << "Span:\n " << span->toString() << "\n\n";
        std::cout << "Blocks:\n " << chronoslots::formatPeriods(schedule.events()) << "\n\n";
        std::cout << "Slots:\n " << chronoslots::formatPeriods(*slots) << std::endl;
        return 0;
    }

    schedule.dump(*slots, FLAGS_prettyPrint);
    std::cout << schedule.json() << std::endl;
    return 0;
}
