#include "Application.hpp"
#include "config/ConfigManager.hpp"
#include "config/SettingsSerializer.hpp"
#include "typokit/Diagnostics.hpp"
#include "typokit/TextNormalizer.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"
#include "utils/Profile.hpp"

#include <charconv>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string_view>

#include <plog/Log.h>

#ifndef TYPOKIT_VERSION_STRING
#define TYPOKIT_VERSION_STRING "0.0.0"
#endif

namespace
{

constexpr const char* kProgramName = "typokit";

std::optional<std::size_t> parseCount(std::string_view text)
{
    std::size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size())
        return std::nullopt;
    return value;
}

} // namespace

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { utils::LogManager::Shutdown(); }

int Application::run()
{
    TYPOKIT_PROFILE_FUNCTION();

    switch (parseCommandLineArgs())
    {
    case ParseOutcome::ExitSuccess:
        return kExitSuccess;
    case ParseOutcome::UsageError:
        return kExitUsage;
    case ParseOutcome::Run:
        break;
    }

    initializeConfig();
    initializeLogging();

    int status = kExitSuccess;
    if (options_.dump_config)
    {
        status = dumpConfig();
    }
    else if (options_.transformations.empty())
    {
        printUsage(std::cout);
    }
    else if (options_.input_path)
    {
        std::ifstream file(*options_.input_path, std::ios::binary);
        if (!file)
        {
            utils::ScopedReportLocation where(*options_.input_path);
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Input, "Cannot open input file");
            status = kExitFailure;
        }
        else
        {
            status = processInput(file, std::cout);
        }
    }
    else
    {
        status = processInput(std::cin, std::cout);
    }

    reportPendingErrors();
    PLOG_INFO << "Exiting with status " << status;
    return status;
}

Application::ParseOutcome Application::parseCommandLineArgs()
{
    auto needsValue = [&](int i, std::string_view flag)
    {
        if (i + 1 < argc_)
            return true;
        std::cerr << kProgramName << ": option '" << flag << "' requires a value\n";
        return false;
    };

    for (int i = 1; i < argc_; ++i)
    {
        std::string_view arg = argv_[i];

        if (arg == "-h" || arg == "--help")
        {
            printUsage(std::cout);
            return ParseOutcome::ExitSuccess;
        }
        if (arg == "--version")
        {
            std::cout << kProgramName << " " << TYPOKIT_VERSION_STRING << "\n";
            return ParseOutcome::ExitSuccess;
        }
        if (arg == "-i" || arg == "--input")
        {
            if (!needsValue(i, arg))
                return ParseOutcome::UsageError;
            options_.input_path = argv_[++i];
        }
        else if (arg == "-c" || arg == "--config")
        {
            if (!needsValue(i, arg))
                return ParseOutcome::UsageError;
            options_.config_path = argv_[++i];
        }
        else if (arg == "--threshold-quote")
        {
            if (!needsValue(i, arg))
                return ParseOutcome::UsageError;
            auto value = parseCount(argv_[++i]);
            if (!value)
            {
                std::cerr << kProgramName << ": invalid value for --threshold-quote: " << argv_[i] << "\n";
                return ParseOutcome::UsageError;
            }
            options_.threshold_quote = *value;
        }
        else if (arg == "--verbose")
        {
            options_.verbose = true;
        }
        else if (arg == "--dump-config")
        {
            options_.dump_config = true;
        }
        else if (arg == "--paragraphs")
        {
            options_.paragraphs = true;
        }
        else if (arg.size() > 1 && arg.front() == '-')
        {
            std::cerr << kProgramName << ": unknown option '" << arg << "'\n";
            return ParseOutcome::UsageError;
        }
        else if (auto t = typokit::parse_transformation(arg))
        {
            options_.transformations.push_back(*t);
        }
        else
        {
            std::cerr << "Error: transformation '" << arg << "' not recognized.\n"
                      << "Valid transformations are:\n";
            printTransformations(std::cerr);
            return ParseOutcome::UsageError;
        }
    }
    return ParseOutcome::Run;
}

void Application::initializeConfig()
{
    config_ = std::make_unique<ConfigManager>(options_.config_path);
    utils::ScopedReportLocation where(config_->path());
    if (!SettingsSerializer::registerWith(*config_, typography_, logging_))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Failed to register settings tables",
                                            config_->lastError());
    }
    config_->load();

    // command line wins over the file
    if (options_.threshold_quote)
        typography_.threshold_quote = *options_.threshold_quote;
    if (options_.verbose)
        logging_.verbose = true;

    typokit::Diagnostics::SetVerbose(logging_.verbose);
}

void Application::initializeLogging()
{
    TYPOKIT_PROFILE_FUNCTION();

    utils::LogManager::Settings settings{ .level = static_cast<plog::Severity>(logging_.level),
                                          .file = logging_.file,
                                          .append = logging_.append,
                                          .console = false };
    if (!utils::LogManager::Initialize(settings))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization,
                                            "Failed to initialize logging system", logging_.file);
        return;
    }

    utils::LogManager::RegisterLogger<0>({ .name = "main",
                                           .filepath = logging_.file,
                                           .append_override = std::nullopt,
                                           .level_override = std::nullopt,
                                           .max_file_size = 10 * 1024 * 1024,
                                           .backup_count = 3,
                                           .add_console_appender = logging_.verbose });

    utils::LogManager::RegisterLogger<typokit::Diagnostics::kLogInstance>(
        { .name = "diagnostics",
          .filepath = utils::LogManager::SiblingLogPath("diagnostics"),
          .append_override = std::nullopt,
          .level_override = plog::info,
          .max_file_size = 10 * 1024 * 1024,
          .backup_count = 3,
          .add_console_appender = false });

#if TYPOKIT_PROFILING_LEVEL >= 1
    utils::LogManager::RegisterLogger<profiling::kProfilingLogInstance>(
        { .name = "profiling",
          .filepath = utils::LogManager::SiblingLogPath("profiling"),
          .append_override = std::nullopt,
          .level_override = plog::debug,
          .max_file_size = 10 * 1024 * 1024,
          .backup_count = 3,
          .add_console_appender = false });
#endif

    PLOG_INFO << kProgramName << " " << TYPOKIT_VERSION_STRING << " starting, config=" << config_->path();
}

int Application::dumpConfig()
{
    if (!config_->save())
        return kExitFailure;
    std::cout << "Configuration written to " << config_->path() << "\n";
    return kExitSuccess;
}

int Application::processInput(std::istream& in, std::ostream& out)
{
    TYPOKIT_PROFILE_FUNCTION();

    std::vector<typokit::Transformation> steps{ typokit::Transformation::CleanWhitespaces };
    steps.insert(steps.end(), options_.transformations.begin(), options_.transformations.end());
    typokit::TextPipeline pipeline(typography_, std::move(steps));

    bool ok = options_.paragraphs ? processParagraphs(pipeline, in, out) : processLines(pipeline, in, out);
    if (!ok)
        return kExitFailure;

    out.flush();
    if (!out)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Output, "Failed to write output");
        return kExitFailure;
    }
    if (in.bad())
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Input, "Error reading input");
        return kExitFailure;
    }
    return kExitSuccess;
}

bool Application::processLines(const typokit::TextPipeline& pipeline, std::istream& in, std::ostream& out)
{
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(in, line))
    {
        ++line_number;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        utils::ScopedReportLocation where("line " + std::to_string(line_number));
        auto result = pipeline.process(line);
        if (!result.succeeded)
            return false;
        out << result.result << '\n';
    }
    PLOG_DEBUG << "Processed " << line_number << " lines";
    return true;
}

bool Application::processParagraphs(const typokit::TextPipeline& pipeline, std::istream& in, std::ostream& out)
{
    std::string text{ std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>() };
    auto paragraphs = typokit::split_paragraphs(text);

    for (std::size_t i = 0; i < paragraphs.size(); ++i)
    {
        utils::ScopedReportLocation where("paragraph " + std::to_string(i + 1));
        auto result = pipeline.process(paragraphs[i]);
        if (!result.succeeded)
            return false;
        if (i > 0)
            out << '\n';
        out << result.result << '\n';
    }
    PLOG_DEBUG << "Processed " << paragraphs.size() << " paragraphs";
    return true;
}

void Application::printTransformations(std::ostream& out) const
{
    for (const auto& info : typokit::transformation_catalog())
        out << "    " << info.name << ": " << info.description << "\n";
}

void Application::printUsage(std::ostream& out) const
{
    out << kProgramName << " " << TYPOKIT_VERSION_STRING << "\n\n"
        << "USAGE: " << kProgramName << " [OPTIONS] <TRANSFORMATION>...\n\n"
        << "Read standard input, sequentially apply each TRANSFORMATION on the text, and print the\n"
        << "result on standard output. Whitespace is always normalized first.\n\n"
        << "OPTIONS:\n"
        << "    -i, --input <file>         read <file> instead of standard input\n"
        << "    -c, --config <file>        configuration file (default: typokit.toml)\n"
        << "        --threshold-quote <n>  quote pairing distance in characters\n"
        << "        --paragraphs           process blank-line separated paragraphs instead of lines\n"
        << "        --verbose              trace every stage to the diagnostics log\n"
        << "        --dump-config          write the effective configuration and exit\n"
        << "    -h, --help                 print this help\n"
        << "        --version              print the version\n\n"
        << "Valid transformations are the following:\n";
    printTransformations(out);
    out << "\nEXAMPLE: " << kProgramName << " clean_quotes clean_ellipsis escape_html\n";
}

void Application::reportPendingErrors() const
{
    std::size_t dropped = utils::ErrorReporter::DroppedCount();
    for (const auto& report : utils::ErrorReporter::TakeReports())
        std::cerr << kProgramName << ": " << utils::ErrorReporter::Describe(report) << "\n";
    if (dropped > 0)
        std::cerr << kProgramName << ": ... and " << dropped << " more (see the log)\n";
}
