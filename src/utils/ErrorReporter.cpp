#include "ErrorReporter.hpp"

#include <plog/Log.h>

#include <utility>

namespace utils
{

namespace
{
thread_local std::string t_location;
}

std::mutex ErrorReporter::s_mutex;
std::vector<ErrorReport> ErrorReporter::s_reports;
std::size_t ErrorReporter::s_dropped = 0;

ScopedReportLocation::ScopedReportLocation(std::string location)
    : previous_(std::exchange(t_location, std::move(location)))
{
}

ScopedReportLocation::~ScopedReportLocation() { t_location = std::move(previous_); }

const std::string& ScopedReportLocation::Current() { return t_location; }

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& message, const std::string& details)
{
    report(category, ErrorSeverity::Warning, message, details);
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& message, const std::string& details)
{
    report(category, ErrorSeverity::Error, message, details);
}

void ErrorReporter::report(ErrorCategory category, ErrorSeverity severity, const std::string& message,
                           const std::string& details)
{
    ErrorReport entry{ .category = category,
                       .severity = severity,
                       .message = message,
                       .details = details,
                       .location = t_location };

    std::string line = Describe(entry);
    if (severity == ErrorSeverity::Warning)
        PLOG_WARNING << "[" << CategoryName(category) << "] " << line;
    else
        PLOG_ERROR << "[" << CategoryName(category) << "] " << line;

    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_reports.size() < kMaxReports)
        s_reports.push_back(std::move(entry));
    else
        ++s_dropped;
}

bool ErrorReporter::HasPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return !s_reports.empty();
}

std::vector<ErrorReport> ErrorReporter::TakeReports()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> reports = std::move(s_reports);
    s_reports.clear();
    s_dropped = 0;
    return reports;
}

std::size_t ErrorReporter::DroppedCount()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_dropped;
}

void ErrorReporter::ClearErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_reports.clear();
    s_dropped = 0;
}

std::string_view ErrorReporter::CategoryName(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "initialization";
    case ErrorCategory::Configuration:
        return "configuration";
    case ErrorCategory::Input:
        return "input";
    case ErrorCategory::Transformation:
        return "transformation";
    case ErrorCategory::Output:
        return "output";
    }
    return "unknown";
}

std::string ErrorReporter::Describe(const ErrorReport& report)
{
    std::string out = report.severity == ErrorSeverity::Warning ? "warning: " : "error: ";
    if (!report.location.empty())
        out += report.location + ": ";
    out += report.message;
    if (!report.details.empty())
        out += " (" + report.details + ")";
    return out;
}

} // namespace utils
