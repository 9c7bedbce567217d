#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "../typokit/Diagnostics.hpp"
#include "Profile.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

bool LogManager::s_initialized = false;
LogManager::Settings LogManager::s_settings;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const Settings& settings)
{
    if (s_initialized)
        return true;

    s_settings = settings;
    if (!PrepareLogDirectory(s_settings.file))
        return false;

    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization,
                                   "LogManager not initialized before registering logger", config.name);
        return false;
    }

    try
    {
        bool append = config.append_override.value_or(s_settings.append);
        if (!append)
        {
            std::ofstream(config.filepath, std::ios::trunc).close();
        }

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.c_str(), config.max_file_size, config.backup_count);

        plog::Severity level = config.level_override.value_or(s_settings.level);

        plog::init<InstanceId>(level, file_appender.get());

        // stdout carries the transformed text, so the console mirror goes to stderr
        if (config.add_console_appender || s_settings.console)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>(plog::streamStdErr);
            if (auto logger = plog::get<InstanceId>())
            {
                logger->addAppender(console_appender.get());
                s_appenders.push_back(std::move(console_appender));
            }
        }

        s_appenders.push_back(std::move(file_appender));
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger: " + config.name,
                                   ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);
template bool LogManager::RegisterLogger<typokit::Diagnostics::kLogInstance>(const LoggerConfig&);

#if TYPOKIT_PROFILING_LEVEL >= 1
template bool LogManager::RegisterLogger<profiling::kProfilingLogInstance>(const LoggerConfig&);
#endif

namespace
{

// plog loggers are static and keep raw appender pointers
template <int InstanceId>
void muteLogger()
{
    if (auto logger = plog::get<InstanceId>())
        logger->setMaxSeverity(plog::none);
}

} // namespace

void LogManager::Shutdown()
{
    muteLogger<0>();
    muteLogger<typokit::Diagnostics::kLogInstance>();
#if TYPOKIT_PROFILING_LEVEL >= 1
    muteLogger<profiling::kProfilingLogInstance>();
#endif
    s_appenders.clear();
    s_initialized = false;
}

bool LogManager::IsInitialized() { return s_initialized; }

const LogManager::Settings& LogManager::CurrentSettings() { return s_settings; }

std::string LogManager::SiblingLogPath(const std::string& suffix)
{
    std::filesystem::path main_log(s_settings.file);
    std::filesystem::path sibling = main_log.parent_path() / (main_log.stem().string() + "_" + suffix);
    sibling += main_log.has_extension() ? main_log.extension() : std::filesystem::path(".log");
    return sibling.string();
}

bool LogManager::PrepareLogDirectory(const std::string& file)
{
    std::filesystem::path dir = std::filesystem::path(file).parent_path();
    if (dir.empty())
        return true;

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory",
                                     dir.string() + ": " + ec.message());
        return false;
    }
    return true;
}

} // namespace utils
