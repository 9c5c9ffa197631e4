#include "chronoslots/ErrorReporter.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

namespace chronoslots {

const char* periodErrorMessage(PeriodError error) {
    switch (error) {
    case PeriodError::kInvalidRange:
        return "Start time must be before end time.";
    }

    return "Unknown period error.";
}

ErrorReporter::ErrorReporter(bool suppress): m_suppress(suppress) {}

ErrorReporter::~ErrorReporter() {}

void ErrorReporter::addError(PeriodError kind, const std::string& message) {
    if (!m_suppress) {
        spdlog::error(message);
    }
    m_errors.emplace_back(Error{kind, message});
}

void ErrorReporter::addInvalidRangeError(Instant start, Instant end) {
    addError(PeriodError::kInvalidRange, fmt::format("{} Got start: {}, end: {}.",
            periodErrorMessage(PeriodError::kInvalidRange), formatInstant(start), formatInstant(end)));
}

} // namespace chronoslots
