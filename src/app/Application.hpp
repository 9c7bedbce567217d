#pragma once

#include "../config/LoggingSettings.hpp"
#include "../typokit/TextPipeline.hpp"
#include "../typokit/TypographyConfig.hpp"

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class ConfigManager;

// Command-line front end: typokit [options] <TRANSFORMATION>...
class Application
{
public:
    static constexpr int kExitSuccess = 0;
    static constexpr int kExitFailure = 1; // I/O error or failed transformation
    static constexpr int kExitUsage = 2;

    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    enum class ParseOutcome
    {
        Run,
        ExitSuccess,
        UsageError
    };

    struct Options
    {
        std::optional<std::string> input_path;
        std::string config_path = "typokit.toml";
        std::optional<std::size_t> threshold_quote;
        bool verbose = false;
        bool dump_config = false;
        bool paragraphs = false;
        std::vector<typokit::Transformation> transformations;
    };

    ParseOutcome parseCommandLineArgs();
    void initializeConfig();
    void initializeLogging();

    int dumpConfig();
    int processInput(std::istream& in, std::ostream& out);
    bool processLines(const typokit::TextPipeline& pipeline, std::istream& in, std::ostream& out);
    bool processParagraphs(const typokit::TextPipeline& pipeline, std::istream& in, std::ostream& out);

    void printUsage(std::ostream& out) const;
    void printTransformations(std::ostream& out) const;
    void reportPendingErrors() const;

    int argc_ = 0;
    char** argv_ = nullptr;

    Options options_;
    typokit::TypographyConfig typography_;
    LoggingSettings logging_;
    std::unique_ptr<ConfigManager> config_;
};
