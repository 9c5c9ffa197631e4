#ifndef SRC_CHRONOSLOTS_ERROR_REPORTER_HPP_
#define SRC_CHRONOSLOTS_ERROR_REPORTER_HPP_

#include "chronoslots/Instant.hpp"
#include "chronoslots/PeriodError.hpp"

#include <string>
#include <vector>

namespace chronoslots {

class ErrorReporter {
public:
    struct Error {
        PeriodError kind;
        std::string message;
    };

    // If suppress is true, will not print reported errors to log (useful for testing failures without
    // polluting the log)
    ErrorReporter(bool suppress = false);
    ~ErrorReporter();

    void addError(PeriodError kind, const std::string& message);

    // Specific errors.

    // Period construction failed, |start| is not strictly before |end|.
    void addInvalidRangeError(Instant start, Instant end);

    size_t errorCount() const { return m_errors.size(); }
    bool ok() const { return m_errors.size() == 0; }
    const std::vector<Error>& errors() const { return m_errors; }
    void clear() { m_errors.clear(); }

private:
    bool m_suppress;
    std::vector<Error> m_errors;
};

} // namespace chronoslots

#endif // SRC_CHRONOSLOTS_ERROR_REPORTER_HPP_
