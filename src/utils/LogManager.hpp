#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

class LogManager
{
public:
    /// Process-wide defaults, normally read from the [logging] table.
    struct Settings
    {
        plog::Severity level = plog::info;
        std::string file = "logs/typokit.log";
        bool append = true;
        bool console = false; // mirror every logger to stderr
    };

    struct LoggerConfig
    {
        std::string name;
        std::string filepath;
        std::optional<bool> append_override;
        std::optional<plog::Severity> level_override;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
        bool add_console_appender = false;
    };

    static bool Initialize(const Settings& settings);

    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    static void Shutdown();

    [[nodiscard]] static bool IsInitialized();
    [[nodiscard]] static const Settings& CurrentSettings();

    /// Path of a companion log next to the main one ("logs/typokit_diagnostics.log").
    [[nodiscard]] static std::string SiblingLogPath(const std::string& suffix);

private:
    LogManager() = default;

    static bool PrepareLogDirectory(const std::string& file);

    static bool s_initialized;
    static Settings s_settings;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
