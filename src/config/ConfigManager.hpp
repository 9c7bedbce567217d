#pragma once

#include <string>
#include <functional>
#include <memory>
#include <vector>

#include <toml++/toml.h>

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
    std::function<toml::table()> save;
};

// Owns the TOML document. Each subsystem registers the table it reads and
// the keys it writes back; keys owned by nobody are preserved on save.
class ConfigManager
{
public:
    explicit ConfigManager(std::string path = "typokit.toml");
    ~ConfigManager();

    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);

    // Missing file: nothing is loaded and defaults stay in place (returns true).
    // Parse error: reported as a warning, returns false.
    bool load();
    bool save();
    const toml::table& root() const;

    const std::string& path() const { return config_path_; }
    const char* lastError() const { return last_error_.c_str(); }

private:
    toml::table* resolveTablePath(toml::table& root, const std::string& path);
    const toml::table* resolveTablePath(const toml::table& root, const std::string& path) const;

    std::string config_path_;
    std::string last_error_;

    struct HandlerEntry {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };
    std::vector<HandlerEntry> handlers_;
    std::unique_ptr<toml::table> root_;
};
