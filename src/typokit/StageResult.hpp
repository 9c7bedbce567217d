#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>

namespace typokit
{

// Outcome of one pipeline stage (or of a whole pipeline run)
template<typename T>
struct StageResult {
    T result{};                              // The payload; default-constructed on failure
    bool succeeded = true;
    std::optional<std::string> error;        // Error message if the stage failed
    std::chrono::microseconds duration{ 0 };
    std::string stage_name;

    static StageResult success(T r, std::chrono::microseconds time, const std::string& name) {
        StageResult res;
        res.result = std::move(r);
        res.succeeded = true;
        res.duration = time;
        res.stage_name = name;
        return res;
    }

    static StageResult failure(const std::string& err, std::chrono::microseconds time, const std::string& name) {
        StageResult res;
        res.succeeded = false;
        res.error = err;
        res.duration = time;
        res.stage_name = name;
        return res;
    }
};

} // namespace typokit
