#pragma once

#include "Diagnostics.hpp"
#include "StageResult.hpp"

#include <chrono>
#include <exception>
#include <string>
#include <utility>

#include <plog/Log.h>

#include "../utils/ErrorReporter.hpp"
#include "../utils/Profile.hpp"

namespace typokit {

// Runs a stage (callable returning T) and wraps the outcome in StageResult<T>.
// Measures duration, traces to the diagnostics log and reports failures;
// the report carries the caller's utils::ScopedReportLocation.
template<typename T, typename Fn>
StageResult<T> run_stage(const std::string& stage_name, Fn&& fn)
{
    TYPOKIT_PROFILE_ZONE(stage_name);

    using namespace std::chrono;
    auto start = high_resolution_clock::now();
    try
    {
        T res = fn();
        auto dur = duration_cast<microseconds>(high_resolution_clock::now() - start);
        if (Diagnostics::IsVerbose()) {
            PLOG_INFO_(Diagnostics::kLogInstance) << "Stage '" << stage_name << "' succeeded in " << dur.count() << "us";
        }
        return StageResult<T>::success(std::move(res), dur, stage_name);
    }
    catch (const std::exception& ex)
    {
        auto dur = duration_cast<microseconds>(high_resolution_clock::now() - start);
        PLOG_ERROR_(Diagnostics::kLogInstance) << "Stage '" << stage_name << "' failed in " << dur.count() << "us: " << ex.what();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Transformation,
            "Text transformation failed",
            stage_name + ": " + ex.what());
        return StageResult<T>::failure(ex.what(), dur, stage_name);
    }
}

} // namespace typokit
