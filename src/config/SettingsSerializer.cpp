#include "SettingsSerializer.hpp"
#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <cstdint>
#include <optional>

namespace
{

std::optional<std::size_t> readThreshold(const toml::table& tbl, std::string_view key)
{
    auto v = tbl[key].value<std::int64_t>();
    if (!v)
        return std::nullopt;
    if (*v < 0)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Ignoring negative threshold, keeping the default",
                                            "typography." + std::string(key) + " = " + std::to_string(*v));
        return std::nullopt;
    }
    return static_cast<std::size_t>(*v);
}

} // namespace

toml::table SettingsSerializer::serializeTypography(const typokit::TypographyConfig& config)
{
    toml::table t;
    t.insert("quotes", config.quotes);
    t.insert("ellipsis", config.ellipsis);
    t.insert("guillemets", config.guillemets);
    t.insert("dashes", config.dashes);
    t.insert("threshold_quote", static_cast<std::int64_t>(config.threshold_quote));
    t.insert("threshold_currency", static_cast<std::int64_t>(config.threshold_currency));
    t.insert("threshold_unit", static_cast<std::int64_t>(config.threshold_unit));
    t.insert("threshold_real_word", static_cast<std::int64_t>(config.threshold_real_word));
    t.insert("colon_full_space", config.colon_full_space);
    return t;
}

void SettingsSerializer::deserializeTypography(const toml::table& t, typokit::TypographyConfig& config)
{
    if (auto v = t["quotes"].value<bool>())
        config.quotes = *v;
    if (auto v = t["ellipsis"].value<bool>())
        config.ellipsis = *v;
    if (auto v = t["guillemets"].value<bool>())
        config.guillemets = *v;
    if (auto v = t["dashes"].value<bool>())
        config.dashes = *v;
    if (auto v = readThreshold(t, "threshold_quote"))
        config.threshold_quote = *v;
    if (auto v = readThreshold(t, "threshold_currency"))
        config.threshold_currency = *v;
    if (auto v = readThreshold(t, "threshold_unit"))
        config.threshold_unit = *v;
    if (auto v = readThreshold(t, "threshold_real_word"))
        config.threshold_real_word = *v;
    if (auto v = t["colon_full_space"].value<bool>())
        config.colon_full_space = *v;
}

toml::table SettingsSerializer::serializeLogging(const LoggingSettings& settings)
{
    toml::table t;
    t.insert("level", settings.level);
    t.insert("file", settings.file);
    t.insert("append", settings.append);
    t.insert("verbose", settings.verbose);
    return t;
}

void SettingsSerializer::deserializeLogging(const toml::table& t, LoggingSettings& settings)
{
    if (auto v = t["level"].value<int>())
    {
        if (*v >= 0 && *v <= 6)
            settings.level = *v;
        else
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                "Ignoring out-of-range logging level",
                                                "logging.level = " + std::to_string(*v));
    }
    if (auto v = t["file"].value<std::string>(); v && !v->empty())
        settings.file = *v;
    if (auto v = t["append"].value<bool>())
        settings.append = *v;
    if (auto v = t["verbose"].value<bool>())
        settings.verbose = *v;
}

const std::vector<std::string>& SettingsSerializer::typographyKeys()
{
    static const std::vector<std::string> keys = {
        "quotes",         "ellipsis",           "guillemets",          "dashes",          "threshold_quote",
        "threshold_currency", "threshold_unit", "threshold_real_word", "colon_full_space"
    };
    return keys;
}

const std::vector<std::string>& SettingsSerializer::loggingKeys()
{
    static const std::vector<std::string> keys = { "level", "file", "append", "verbose" };
    return keys;
}

bool SettingsSerializer::registerWith(ConfigManager& manager, typokit::TypographyConfig& config,
                                      LoggingSettings& logging)
{
    bool ok = manager.registerTable("typography",
                                    TableCallbacks{
                                        .load = [&config](const toml::table& t) { deserializeTypography(t, config); },
                                        .save = [&config]() { return serializeTypography(config); } },
                                    typographyKeys());
    ok = manager.registerTable("logging",
                               TableCallbacks{
                                   .load = [&logging](const toml::table& t) { deserializeLogging(t, logging); },
                                   .save = [&logging]() { return serializeLogging(logging); } },
                               loggingKeys()) && ok;
    return ok;
}
