#include <catch2/catch_test_macros.hpp>

#include "utils/ErrorReporter.hpp"

#include <string>
#include <thread>

using namespace utils;

TEST_CASE("ErrorReporter queues reports in order", "[error_reporter]") {
    ErrorReporter::ClearErrors();
    REQUIRE_FALSE(ErrorReporter::HasPendingErrors());

    ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Ignoring negative threshold", "threshold_quote = -1");
    ErrorReporter::ReportError(ErrorCategory::Input, "Cannot open input file");

    REQUIRE(ErrorReporter::HasPendingErrors());

    auto reports = ErrorReporter::TakeReports();
    REQUIRE(reports.size() == 2);
    REQUIRE(reports[0].severity == ErrorSeverity::Warning);
    REQUIRE(reports[0].message == "Ignoring negative threshold");
    REQUIRE(reports[0].details == "threshold_quote = -1");
    REQUIRE(reports[1].category == ErrorCategory::Input);
    REQUIRE(reports[1].severity == ErrorSeverity::Error);
    REQUIRE(reports[1].details.empty());
    REQUIRE_FALSE(ErrorReporter::HasPendingErrors());
}

TEST_CASE("Reports carry the innermost location", "[error_reporter]") {
    ErrorReporter::ClearErrors();
    REQUIRE(ScopedReportLocation::Current().empty());

    {
        ScopedReportLocation file("typokit.toml");
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "outer");
        {
            ScopedReportLocation line("line 3");
            ErrorReporter::ReportError(ErrorCategory::Transformation, "inner");
        }
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "restored");
    }
    ErrorReporter::ReportError(ErrorCategory::Output, "none");

    auto reports = ErrorReporter::TakeReports();
    REQUIRE(reports.size() == 4);
    REQUIRE(reports[0].location == "typokit.toml");
    REQUIRE(reports[1].location == "line 3");
    REQUIRE(reports[2].location == "typokit.toml");
    REQUIRE(reports[3].location.empty());
}

TEST_CASE("Locations are per thread", "[error_reporter]") {
    ErrorReporter::ClearErrors();
    ScopedReportLocation here("main thread");

    std::thread worker([] { ErrorReporter::ReportError(ErrorCategory::Transformation, "from worker"); });
    worker.join();

    auto reports = ErrorReporter::TakeReports();
    REQUIRE(reports.size() == 1);
    REQUIRE(reports[0].location.empty());
}

TEST_CASE("ErrorReporter keeps the first reports and counts the rest", "[error_reporter]") {
    ErrorReporter::ClearErrors();
    for (int i = 0; i < 105; ++i)
        ErrorReporter::ReportWarning(ErrorCategory::Transformation, std::to_string(i));

    REQUIRE(ErrorReporter::DroppedCount() == 5);
    auto reports = ErrorReporter::TakeReports();
    REQUIRE(reports.size() == ErrorReporter::kMaxReports);
    REQUIRE(reports.front().message == "0");
    REQUIRE(reports.back().message == "99");
    REQUIRE(ErrorReporter::DroppedCount() == 0);
}

TEST_CASE("Describe renders one summary line", "[error_reporter]") {
    ErrorReport located{ .category = ErrorCategory::Transformation,
                         .severity = ErrorSeverity::Error,
                         .message = "Text transformation failed",
                         .details = "clean_quotes: invalid UTF-8",
                         .location = "line 3" };
    REQUIRE(ErrorReporter::Describe(located) ==
            "error: line 3: Text transformation failed (clean_quotes: invalid UTF-8)");

    ErrorReport bare{ .category = ErrorCategory::Output,
                      .severity = ErrorSeverity::Warning,
                      .message = "Failed to write output",
                      .details = "",
                      .location = "" };
    REQUIRE(ErrorReporter::Describe(bare) == "warning: Failed to write output");
}

TEST_CASE("Category names", "[error_reporter]") {
    REQUIRE(ErrorReporter::CategoryName(ErrorCategory::Output) == "output");
    REQUIRE(ErrorReporter::CategoryName(ErrorCategory::Configuration) == "configuration");
}
