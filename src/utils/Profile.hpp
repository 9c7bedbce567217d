#pragma once

// TYPOKIT_PROFILING_LEVEL is set by CMake:
//   0 = off
//   1 = scope timers written to the profiling log
//   2 = scope timers + Tracy zones

#ifndef TYPOKIT_PROFILING_LEVEL
#define TYPOKIT_PROFILING_LEVEL 0
#endif

#if TYPOKIT_PROFILING_LEVEL >= 1

#include <chrono>
#include <string>
#include <string_view>

#include <plog/Log.h>

#if TYPOKIT_PROFILING_LEVEL >= 2
#include <tracy/Tracy.hpp>
#endif

namespace profiling
{

constexpr int kProfilingLogInstance = 2;

// Logs the time spent in a scope, in microseconds, to the profiling log
class ScopeTimer
{
public:
    explicit ScopeTimer(std::string_view label)
        : label_(label)
        , start_(std::chrono::steady_clock::now())
    {
    }

    ~ScopeTimer()
    {
        auto us = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start_);
        PLOG_DEBUG_(kProfilingLogInstance) << label_ << ": " << us.count() << " us";
    }

    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;

    const std::string& label() const { return label_; }

private:
    std::string label_;
    std::chrono::steady_clock::time_point start_;
};

#if TYPOKIT_PROFILING_LEVEL >= 2
inline void nameZone(tracy::ScopedZone& zone, const std::string& label) { zone.Name(label.data(), label.size()); }
#endif

} // namespace profiling

#endif

#if TYPOKIT_PROFILING_LEVEL == 0
#define TYPOKIT_PROFILE_ZONE(label) ((void)0)
#elif TYPOKIT_PROFILING_LEVEL == 1
#define TYPOKIT_PROFILE_ZONE(label) ::profiling::ScopeTimer typokit_scope_timer_(label)
#else
#define TYPOKIT_PROFILE_ZONE(label)                                  \
    ZoneScoped;                                                      \
    ::profiling::ScopeTimer typokit_scope_timer_(label);             \
    ::profiling::nameZone(___tracy_scoped_zone, typokit_scope_timer_.label())
#endif

#define TYPOKIT_PROFILE_FUNCTION() TYPOKIT_PROFILE_ZONE(__func__)
