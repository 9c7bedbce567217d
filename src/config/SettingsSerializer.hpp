#pragma once

#include "LoggingSettings.hpp"
#include "../typokit/TypographyConfig.hpp"

#include <toml++/toml.h>
#include <string>
#include <vector>

class ConfigManager;

// TOML mapping of the [typography] and [logging] tables
class SettingsSerializer
{
public:
    static toml::table serializeTypography(const typokit::TypographyConfig& config);

    // Keys that are absent or invalid leave the current value untouched.
    // Negative thresholds are rejected with a warning.
    static void deserializeTypography(const toml::table& tbl, typokit::TypographyConfig& config);

    static toml::table serializeLogging(const LoggingSettings& settings);
    static void deserializeLogging(const toml::table& tbl, LoggingSettings& settings);

    static const std::vector<std::string>& typographyKeys();
    static const std::vector<std::string>& loggingKeys();

    // Binds both tables to @p config and @p logging; they must outlive the manager.
    static bool registerWith(ConfigManager& manager, typokit::TypographyConfig& config, LoggingSettings& logging);
};
