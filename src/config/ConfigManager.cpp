#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <toml++/toml.h>
#include <plog/Log.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace
{

bool ownsKey(const std::vector<std::string>& owned, std::string_view key)
{
    return std::find(owned.begin(), owned.end(), key) != owned.end();
}

std::vector<std::string> splitPath(const std::string& path)
{
    std::vector<std::string> segments;
    std::istringstream ss(path);
    std::string segment;
    while (std::getline(ss, segment, '.'))
        segments.push_back(segment);
    return segments;
}

} // namespace

ConfigManager::ConfigManager(std::string path)
    : config_path_(std::move(path))
{
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys)
{
    for (const auto& handler : handlers_)
    {
        if (handler.path != path)
            continue;
        for (const auto& key : ownedKeys)
        {
            if (ownsKey(handler.ownedKeys, key))
            {
                last_error_ = "Duplicate ownership: key '" + key + "' at path '" + path + "' already registered";
                PLOG_ERROR << last_error_;
                return false;
            }
        }
    }

    handlers_.push_back({ path, std::move(cb), std::move(ownedKeys) });
    return true;
}

bool ConfigManager::load()
{
    utils::ScopedReportLocation where(config_path_);
    last_error_.clear();
    root_ = std::make_unique<toml::table>();

    std::error_code ec;
    if (!fs::exists(config_path_, ec))
    {
        PLOG_DEBUG << "No config file at " << config_path_ << ", using defaults";
        return true;
    }

    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        last_error_ = "cannot open " + config_path_;
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file could not be read. Using defaults.");
        return false;
    }

    try
    {
        *root_ = toml::parse(ifs, config_path_);
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = std::string("config parse error: ") + std::string(pe.description());

        std::string details = std::string(pe.description());
        if (pe.source().begin.line > 0)
            details = "line " + std::to_string(pe.source().begin.line) + ": " + details;

        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors. Using defaults.", details);
        root_ = std::make_unique<toml::table>();
        return false;
    }

    static const toml::table empty;
    for (const auto& handler : handlers_)
    {
        const toml::table* section = resolveTablePath(*root_, handler.path);
        handler.callbacks.load(section ? *section : empty);
    }

    PLOG_INFO << "Loaded config from " << config_path_;
    return true;
}

bool ConfigManager::save()
{
    utils::ScopedReportLocation where(config_path_);
    last_error_.clear();

    toml::table output = root_ ? *root_ : toml::table{};
    for (const auto& handler : handlers_)
    {
        toml::table produced = handler.callbacks.save();

        toml::table* target = resolveTablePath(output, handler.path);
        if (!target)
            target = &output;

        for (const auto& [key, value] : produced)
        {
            if (!ownsKey(handler.ownedKeys, key.str()))
                PLOG_WARNING << "Handler at path '" << handler.path << "' returned unexpected key '" << key.str()
                             << "' (not in ownedKeys); stripping it";
        }

        for (const auto& key : handler.ownedKeys)
        {
            if (const toml::node* value = produced.get(key))
                target->insert_or_assign(key, *value);
            else
                target->erase(key);
        }
    }

    const std::string tmp = config_path_ + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary);
        if (!ofs)
        {
            last_error_ = "Failed to open temp file for writing";
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                              "Could not create temporary file for writing: " + tmp);
            return false;
        }
        ofs << output << '\n';
        if (!ofs.flush())
        {
            last_error_ = "Failed to write temp file";
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                              "Write error on " + tmp);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmp, config_path_, ec);
    if (ec)
    {
        last_error_ = std::string("Failed to rename: ") + ec.message();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                          "Could not rename temporary file: " + ec.message());
        return false;
    }

    root_ = std::make_unique<toml::table>(std::move(output));
    PLOG_INFO << "Saved config to " << config_path_;
    return true;
}

const toml::table& ConfigManager::root() const
{
    static const toml::table empty;
    return root_ ? *root_ : empty;
}

// Creates the missing tables along the path
toml::table* ConfigManager::resolveTablePath(toml::table& root, const std::string& path)
{
    toml::table* current = &root;
    for (const auto& segment : splitPath(path))
    {
        if (segment.empty())
        {
            PLOG_WARNING << "Invalid path segment (empty) in path: " << path;
            return nullptr;
        }

        auto it = current->find(segment);
        if (it == current->end())
            it = current->insert(segment, toml::table{}).first;

        current = it->second.as_table();
        if (!current)
        {
            PLOG_WARNING << "Path segment '" << segment << "' exists but is not a table";
            return nullptr;
        }
    }
    return current;
}

const toml::table* ConfigManager::resolveTablePath(const toml::table& root, const std::string& path) const
{
    const toml::table* current = &root;
    for (const auto& segment : splitPath(path))
    {
        if (segment.empty())
        {
            PLOG_WARNING << "Invalid path segment (empty) in path: " << path;
            return nullptr;
        }

        auto it = current->find(segment);
        if (it == current->end())
            return nullptr;

        current = it->second.as_table();
        if (!current)
        {
            PLOG_WARNING << "Path segment '" << segment << "' exists but is not a table";
            return nullptr;
        }
    }
    return current;
}
