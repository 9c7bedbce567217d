#pragma once

#include <string>

// [logging] table
struct LoggingSettings
{
    int level = 4; // plog::Severity, 0 (none) to 6 (verbose)
    std::string file = "logs/typokit.log";
    bool append = true;
    bool verbose = false; // per-stage pipeline trace
};
