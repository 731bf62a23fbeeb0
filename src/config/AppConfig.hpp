#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace config
{

struct Department
{
    std::string id;
    std::string name;
    int view_id = 0;
};

struct UpstreamConfig
{
    std::string base_url;
    std::string tenant_segment;
    std::string probe_path = "/videos/{id}/download";
    std::string listing_url; // overrides the department view when set
    std::string default_department;
    std::vector<Department> departments;
};

struct ProbeConfig
{
    int timeout_ms = 3000;
    int connect_timeout_ms = 3000;
    int retries = 1;
    int backoff_ms = 500;
};

struct ScannerConfig
{
    int batch_size = 100;
    std::int64_t max_range = 10000;
    int inter_batch_delay_ms = 10;
    int timeout_run_threshold = 200;
    int give_up_threshold = 400;
};

struct DiscoveryConfig
{
    int fast_path_cap = 30;
    std::int64_t one_month_id_buffer = 3000;
    std::int64_t absolute_floor = 0;
    std::int64_t overlap_margin = 500;
    int recent_window_hours = 7 * 24;
    bool always_scan = false;
};

struct ListingConfig
{
    std::string chromium_path;
    int render_timeout_ms = 20000;
};

struct StateConfig
{
    std::string remote_url;
    std::string key = "video_scanner";
    int remote_timeout_ms = 5000;
    std::string local_path = "data/last_video_scan.json";
};

struct RegistryConfig
{
    std::string meetings_path = "data/meetings.json";
};

struct LoggingConfig
{
    int level = 4; // plog::info
    bool append = true;
    std::string file = "logs/civicscan.log";
    bool verbose = false;
};

struct AppConfig
{
    UpstreamConfig upstream;
    ProbeConfig probe;
    ScannerConfig scanner;
    DiscoveryConfig discovery;
    ListingConfig listing;
    StateConfig state;
    RegistryConfig registry;
    LoggingConfig logging;
};

} // namespace config
