#pragma once

#include "AppConfig.hpp"

#include <string>
#include <string_view>

#include <toml++/toml.h>

// Loads config.toml into an AppConfig, then layers environment overrides on top.
// A missing file yields defaults; a malformed file is an error.
class ConfigManager
{
public:
    ConfigManager();
    explicit ConfigManager(std::string config_path);

    bool load();
    bool loadFromString(std::string_view toml_text);

    // DEPARTMENT_ID, PUPPETEER_EXECUTABLE_PATH, CIVICSCAN_STATE_URL
    void applyEnvironment();

    bool validate();

    const config::AppConfig& config() const { return config_; }
    config::AppConfig& mutableConfig() { return config_; }

    const std::string& path() const { return config_path_; }
    const char* lastError() const { return last_error_.c_str(); }

    // Resolves the listing page: explicit listing_url, else the department's view
    std::string resolveListingUrl(const std::string& department_id) const;

private:
    bool applyTable(const toml::table& root);

    std::string config_path_;
    std::string last_error_;
    config::AppConfig config_;
};
