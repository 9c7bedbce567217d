#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // logging setup
    Configuration,  // TOML parsing, invalid values, saving
    Input,          // unreadable input file or stream
    Transformation, // a pipeline stage failed (malformed UTF-8)
    Output          // write failure
};

enum class ErrorSeverity
{
    Warning, // the run continues with a fallback
    Error    // the current unit or the whole run failed
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Transformation;
    ErrorSeverity severity = ErrorSeverity::Error;
    std::string message;
    std::string details;
    std::string location; // "line 3", "paragraph 2", a config path; empty if unknown
};

/**
 * @brief Names where the reports raised on this thread come from.
 *
 * The location is attached to every report made while the object lives.
 * Scopes nest; the innermost one wins and the outer one is restored on
 * destruction.
 *
 *   utils::ScopedReportLocation where("line " + std::to_string(n));
 *   pipeline.process(line); // a failing stage reports "line n"
 */
class ScopedReportLocation
{
public:
    explicit ScopedReportLocation(std::string location);
    ~ScopedReportLocation();

    ScopedReportLocation(const ScopedReportLocation&) = delete;
    ScopedReportLocation& operator=(const ScopedReportLocation&) = delete;

    static const std::string& Current();

private:
    std::string previous_;
};

/**
 * @brief Collects problems for the end-of-run summary on stderr.
 *
 * Every report is logged through plog when it is made. The queue keeps the
 * first kMaxReports reports of a run; later ones are only logged and
 * counted, since the first failure is usually the one that explains the
 * others.
 */
class ErrorReporter
{
public:
    static constexpr std::size_t kMaxReports = 100;

    static void ReportWarning(ErrorCategory category, const std::string& message, const std::string& details = "");
    static void ReportError(ErrorCategory category, const std::string& message, const std::string& details = "");

    static bool HasPendingErrors();

    // Drains the queue and resets the dropped count
    static std::vector<ErrorReport> TakeReports();

    // Reports logged but not queued since the last drain
    static std::size_t DroppedCount();

    static void ClearErrors();

    static std::string_view CategoryName(ErrorCategory category);

    // "error: line 3: Text transformation failed (clean_quotes: invalid UTF-8 at byte 4)"
    static std::string Describe(const ErrorReport& report);

private:
    static void report(ErrorCategory category, ErrorSeverity severity, const std::string& message,
                       const std::string& details);

    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_reports;
    static std::size_t s_dropped;
};

} // namespace utils
