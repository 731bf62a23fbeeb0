#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <cstdlib>
#include <fstream>

namespace
{

template <typename T>
void read_value(const toml::table& table, const char* key, T& out)
{
    if (auto v = table[key].value<T>())
        out = *v;
}

void read_int(const toml::table& table, const char* key, int& out)
{
    if (auto v = table[key].value<int64_t>())
        out = static_cast<int>(*v);
}

} // namespace

ConfigManager::ConfigManager()
    : config_path_("config.toml")
{
}

ConfigManager::ConfigManager(std::string config_path)
    : config_path_(std::move(config_path))
{
}

bool ConfigManager::load()
{
    last_error_.clear();
    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        PLOG_INFO << "No configuration at " << config_path_ << ", using defaults";
        return true;
    }

    try
    {
        auto root = toml::parse(ifs, config_path_);
        return applyTable(root);
    }
    catch (const toml::parse_error& pe)
    {
        std::string error_details = std::string(pe.description());
        if (pe.source().begin.line > 0)
        {
            error_details = "Error at line " + std::to_string(pe.source().begin.line) + ": " + error_details;
        }
        last_error_ = "config parse error: " + error_details;
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Configuration file has errors",
                                          error_details + "\nFile: " + config_path_);
        return false;
    }
}

bool ConfigManager::loadFromString(std::string_view toml_text)
{
    last_error_.clear();
    try
    {
        auto root = toml::parse(toml_text);
        return applyTable(root);
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = std::string("config parse error: ") + std::string(pe.description());
        PLOG_WARNING << last_error_;
        return false;
    }
}

bool ConfigManager::applyTable(const toml::table& root)
{
    auto& cfg = config_;

    if (auto up = root["upstream"].as_table())
    {
        read_value(*up, "base_url", cfg.upstream.base_url);
        read_value(*up, "tenant_segment", cfg.upstream.tenant_segment);
        read_value(*up, "probe_path", cfg.upstream.probe_path);
        read_value(*up, "listing_url", cfg.upstream.listing_url);
        read_value(*up, "default_department", cfg.upstream.default_department);

        if (auto depts = (*up)["departments"].as_array())
        {
            cfg.upstream.departments.clear();
            for (const auto& node : *depts)
            {
                const auto* dept_table = node.as_table();
                if (!dept_table)
                {
                    PLOG_WARNING << "Skipping non-table entry in upstream.departments";
                    continue;
                }
                config::Department dept;
                read_value(*dept_table, "id", dept.id);
                read_value(*dept_table, "name", dept.name);
                read_int(*dept_table, "view_id", dept.view_id);
                if (dept.id.empty())
                {
                    PLOG_WARNING << "Skipping department without id";
                    continue;
                }
                cfg.upstream.departments.push_back(std::move(dept));
            }
        }
    }

    if (auto probe = root["probe"].as_table())
    {
        read_int(*probe, "timeout_ms", cfg.probe.timeout_ms);
        read_int(*probe, "connect_timeout_ms", cfg.probe.connect_timeout_ms);
        read_int(*probe, "retries", cfg.probe.retries);
        read_int(*probe, "backoff_ms", cfg.probe.backoff_ms);
    }

    bool give_up_set = false;
    if (auto scanner = root["scanner"].as_table())
    {
        read_int(*scanner, "batch_size", cfg.scanner.batch_size);
        read_value(*scanner, "max_range", cfg.scanner.max_range);
        read_int(*scanner, "inter_batch_delay_ms", cfg.scanner.inter_batch_delay_ms);
        read_int(*scanner, "timeout_run_threshold", cfg.scanner.timeout_run_threshold);
        give_up_set = (*scanner)["give_up_threshold"].is_integer();
        read_int(*scanner, "give_up_threshold", cfg.scanner.give_up_threshold);
    }
    if (!give_up_set)
        cfg.scanner.give_up_threshold = cfg.scanner.timeout_run_threshold * 2;

    if (auto disc = root["discovery"].as_table())
    {
        read_int(*disc, "fast_path_cap", cfg.discovery.fast_path_cap);
        read_value(*disc, "one_month_id_buffer", cfg.discovery.one_month_id_buffer);
        read_value(*disc, "absolute_floor", cfg.discovery.absolute_floor);
        read_value(*disc, "overlap_margin", cfg.discovery.overlap_margin);
        read_int(*disc, "recent_window_hours", cfg.discovery.recent_window_hours);
        read_value(*disc, "always_scan", cfg.discovery.always_scan);
    }

    if (auto listing = root["listing"].as_table())
    {
        read_value(*listing, "chromium_path", cfg.listing.chromium_path);
        read_int(*listing, "render_timeout_ms", cfg.listing.render_timeout_ms);
    }

    if (auto state = root["state"].as_table())
    {
        read_value(*state, "remote_url", cfg.state.remote_url);
        read_value(*state, "key", cfg.state.key);
        read_int(*state, "remote_timeout_ms", cfg.state.remote_timeout_ms);
        read_value(*state, "local_path", cfg.state.local_path);
    }

    if (auto registry = root["registry"].as_table())
    {
        read_value(*registry, "meetings_path", cfg.registry.meetings_path);
    }

    if (auto logging = root["logging"].as_table())
    {
        if (auto level = (*logging)["level"].value<int64_t>())
        {
            if (*level >= 0 && *level <= 6)
                cfg.logging.level = static_cast<int>(*level);
            else
                PLOG_WARNING << "Ignoring logging.level " << *level << " (expected 0-6)";
        }
        read_value(*logging, "append", cfg.logging.append);
        read_value(*logging, "file", cfg.logging.file);
    }

    return true;
}

void ConfigManager::applyEnvironment()
{
    if (const char* dept = std::getenv("DEPARTMENT_ID"); dept && *dept)
        config_.upstream.default_department = dept;
    if (const char* chromium = std::getenv("PUPPETEER_EXECUTABLE_PATH"); chromium && *chromium)
        config_.listing.chromium_path = chromium;
    if (const char* state_url = std::getenv("CIVICSCAN_STATE_URL"); state_url && *state_url)
        config_.state.remote_url = state_url;
}

bool ConfigManager::validate()
{
    const auto& cfg = config_;
    auto fail = [this](const std::string& message)
    {
        last_error_ = message;
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Invalid configuration", message);
        return false;
    };

    if (cfg.upstream.base_url.empty())
        return fail("upstream.base_url is required");
    if (cfg.upstream.tenant_segment.empty())
        return fail("upstream.tenant_segment is required");
    if (cfg.scanner.batch_size <= 0)
        return fail("scanner.batch_size must be positive");
    if (cfg.scanner.max_range < 0)
        return fail("scanner.max_range must not be negative");
    if (cfg.scanner.timeout_run_threshold < 0)
        return fail("scanner.timeout_run_threshold must not be negative");
    if (cfg.scanner.give_up_threshold < cfg.scanner.timeout_run_threshold)
        return fail("scanner.give_up_threshold must be >= scanner.timeout_run_threshold");
    if (cfg.probe.retries < 0 || cfg.probe.timeout_ms <= 0)
        return fail("probe.retries must be >= 0 and probe.timeout_ms positive");
    if (cfg.discovery.fast_path_cap < 0 || cfg.discovery.overlap_margin < 0)
        return fail("discovery.fast_path_cap and discovery.overlap_margin must not be negative");

    return true;
}

std::string ConfigManager::resolveListingUrl(const std::string& department_id) const
{
    const auto& up = config_.upstream;
    if (!up.listing_url.empty())
        return up.listing_url;

    const std::string wanted = department_id.empty() ? up.default_department : department_id;
    for (const auto& dept : up.departments)
    {
        if (dept.id == wanted && dept.view_id > 0)
        {
            std::string base = up.base_url;
            while (!base.empty() && base.back() == '/')
                base.pop_back();
            return base + "/views/" + std::to_string(dept.view_id) + "/";
        }
    }

    if (!wanted.empty())
        PLOG_WARNING << "Department \"" << wanted << "\" not found or has no view_id";
    return {};
}
