#include <catch2/catch_test_macros.hpp>

#include "config/ConfigManager.hpp"
#include "config/LoggingSettings.hpp"
#include "config/SettingsSerializer.hpp"
#include "typokit/TypographyConfig.hpp"
#include "utils/ErrorReporter.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

namespace
{

// Config file in its own temporary directory, removed on scope exit
class TempConfig
{
public:
    explicit TempConfig(const std::string& name)
        : dir_(fs::temp_directory_path() / ("typokit_test_" + name))
    {
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    ~TempConfig()
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string path() const { return (dir_ / "typokit.toml").string(); }

    void write(const std::string& content) const
    {
        std::ofstream out(path(), std::ios::binary);
        out << content;
    }

private:
    fs::path dir_;
};

} // namespace

TEST_CASE("Missing config file keeps the defaults", "[config]") {
    TempConfig tmp("missing");
    ConfigManager manager(tmp.path());
    typokit::TypographyConfig typography;
    LoggingSettings logging;
    REQUIRE(SettingsSerializer::registerWith(manager, typography, logging));

    REQUIRE(manager.load());
    REQUIRE(typography == typokit::TypographyConfig{});
    REQUIRE(logging.level == 4);
    REQUIRE(logging.file == "logs/typokit.log");
}

TEST_CASE("Config values are read from their tables", "[config]") {
    TempConfig tmp("values");
    tmp.write("[typography]\n"
              "quotes = false\n"
              "dashes = true\n"
              "threshold_quote = 5\n"
              "threshold_currency = 4\n"
              "colon_full_space = true\n"
              "\n"
              "[logging]\n"
              "level = 5\n"
              "file = \"out/custom.log\"\n"
              "verbose = true\n");

    ConfigManager manager(tmp.path());
    typokit::TypographyConfig typography;
    LoggingSettings logging;
    REQUIRE(SettingsSerializer::registerWith(manager, typography, logging));
    REQUIRE(manager.load());

    REQUIRE_FALSE(typography.quotes);
    REQUIRE(typography.dashes);
    REQUIRE(typography.ellipsis);
    REQUIRE(typography.threshold_quote == 5);
    REQUIRE(typography.threshold_currency == 4);
    REQUIRE(typography.threshold_unit == 2);
    REQUIRE(typography.colon_full_space);

    REQUIRE(logging.level == 5);
    REQUIRE(logging.file == "out/custom.log");
    REQUIRE(logging.verbose);
}

TEST_CASE("Invalid values are rejected with a warning", "[config]") {
    utils::ErrorReporter::ClearErrors();

    TempConfig tmp("invalid");
    tmp.write("[typography]\n"
              "threshold_quote = -1\n"
              "threshold_unit = 3\n"
              "[logging]\n"
              "level = 42\n");

    ConfigManager manager(tmp.path());
    typokit::TypographyConfig typography;
    LoggingSettings logging;
    REQUIRE(SettingsSerializer::registerWith(manager, typography, logging));
    REQUIRE(manager.load());

    REQUIRE(typography.threshold_quote == 20);
    REQUIRE(typography.threshold_unit == 3);
    REQUIRE(logging.level == 4);

    auto reports = utils::ErrorReporter::TakeReports();
    REQUIRE(reports.size() == 2);
    for (const auto& report : reports)
    {
        REQUIRE(report.category == utils::ErrorCategory::Configuration);
        REQUIRE(report.severity == utils::ErrorSeverity::Warning);
        REQUIRE(report.location == tmp.path());
    }
}

TEST_CASE("A malformed config file falls back to defaults", "[config]") {
    utils::ErrorReporter::ClearErrors();

    TempConfig tmp("malformed");
    tmp.write("[typography\nquotes = false\n");

    ConfigManager manager(tmp.path());
    typokit::TypographyConfig typography;
    LoggingSettings logging;
    REQUIRE(SettingsSerializer::registerWith(manager, typography, logging));

    REQUIRE_FALSE(manager.load());
    REQUIRE(typography.quotes);
    REQUIRE(std::string(manager.lastError()).find("parse error") != std::string::npos);
    auto reports = utils::ErrorReporter::TakeReports();
    REQUIRE(reports.size() == 1);
    REQUIRE(reports[0].category == utils::ErrorCategory::Configuration);
    REQUIRE(reports[0].location == tmp.path());
    REQUIRE(reports[0].details.rfind("line ", 0) == 0);
}

TEST_CASE("Saving writes owned keys and preserves the others", "[config]") {
    TempConfig tmp("save");
    tmp.write("[other]\n"
              "key = 1\n"
              "[typography]\n"
              "custom = \"kept\"\n"
              "threshold_quote = 8\n");

    {
        ConfigManager manager(tmp.path());
        typokit::TypographyConfig typography;
        LoggingSettings logging;
        REQUIRE(SettingsSerializer::registerWith(manager, typography, logging));
        REQUIRE(manager.load());
        REQUIRE(typography.threshold_quote == 8);

        typography.guillemets = true;
        typography.threshold_real_word = 6;
        REQUIRE(manager.save());

        const toml::table& root = manager.root();
        REQUIRE(root["other"]["key"].value<std::int64_t>() == 1);
        REQUIRE(root["typography"]["custom"].value<std::string>() == "kept");
        REQUIRE(root["logging"]["level"].value<std::int64_t>() == 4);
    }

    ConfigManager reloaded(tmp.path());
    typokit::TypographyConfig typography;
    LoggingSettings logging;
    REQUIRE(SettingsSerializer::registerWith(reloaded, typography, logging));
    REQUIRE(reloaded.load());

    REQUIRE(typography.guillemets);
    REQUIRE(typography.threshold_quote == 8);
    REQUIRE(typography.threshold_real_word == 6);
    REQUIRE(reloaded.root()["other"]["key"].value<std::int64_t>() == 1);
    REQUIRE_FALSE(fs::exists(tmp.path() + ".tmp"));
}

TEST_CASE("A key cannot be owned twice", "[config]") {
    ConfigManager manager("unused.toml");
    typokit::TypographyConfig typography;
    LoggingSettings logging;
    REQUIRE(SettingsSerializer::registerWith(manager, typography, logging));

    TableCallbacks callbacks{ .load = [](const toml::table&) {}, .save = []() { return toml::table{}; } };
    REQUIRE_FALSE(manager.registerTable("typography", callbacks, { "quotes" }));
    REQUIRE(manager.registerTable("typography", callbacks, { "extra" }));
}

TEST_CASE("Typography settings serialize every key", "[config]") {
    typokit::TypographyConfig config;
    config.threshold_unit = 9;
    toml::table t = SettingsSerializer::serializeTypography(config);

    for (const auto& key : SettingsSerializer::typographyKeys())
        REQUIRE(t.contains(key));

    typokit::TypographyConfig copy;
    SettingsSerializer::deserializeTypography(t, copy);
    REQUIRE(copy == config);
}
