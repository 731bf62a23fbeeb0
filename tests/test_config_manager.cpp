#include <catch2/catch_test_macros.hpp>
#include "config/ConfigManager.hpp"
#include "utils/fakes.hpp"

#include <cstdlib>
#include <fstream>

TEST_CASE("ConfigManager uses defaults without a file", "[config]")
{
    test_utils::TempDir dir;
    ConfigManager mgr((dir.path() / "missing.toml").string());

    REQUIRE(mgr.load());
    const auto& cfg = mgr.config();
    REQUIRE(cfg.scanner.batch_size == 100);
    REQUIRE(cfg.scanner.max_range == 10000);
    REQUIRE(cfg.scanner.timeout_run_threshold == 200);
    REQUIRE(cfg.scanner.give_up_threshold == 400);
    REQUIRE(cfg.discovery.fast_path_cap == 30);
    REQUIRE(cfg.discovery.overlap_margin == 500);
    REQUIRE(cfg.state.key == "video_scanner");
    REQUIRE(cfg.probe.retries == 1);
}

TEST_CASE("ConfigManager reads every section", "[config]")
{
    ConfigManager mgr;
    REQUIRE(mgr.loadFromString(R"(
        [upstream]
        base_url = "https://tenant.example.com/"
        tenant_segment = "/jupiterfl/"
        default_department = "city-council"
        departments = [
          { id = "city-council", name = "City Council", view_id = 4 },
          { id = "planning", name = "Planning Board", view_id = 7 },
        ]

        [probe]
        timeout_ms = 1500
        retries = 2

        [scanner]
        batch_size = 50
        timeout_run_threshold = 100

        [discovery]
        absolute_floor = 1000
        always_scan = true

        [state]
        remote_url = "https://state.example.com/state"

        [logging]
        level = 5
        append = false
    )"));

    const auto& cfg = mgr.config();
    REQUIRE(cfg.upstream.base_url == "https://tenant.example.com/");
    REQUIRE(cfg.upstream.departments.size() == 2);
    REQUIRE(cfg.upstream.departments[1].view_id == 7);
    REQUIRE(cfg.probe.timeout_ms == 1500);
    REQUIRE(cfg.probe.retries == 2);
    REQUIRE(cfg.scanner.batch_size == 50);
    REQUIRE(cfg.scanner.timeout_run_threshold == 100);
    REQUIRE(cfg.scanner.give_up_threshold == 200);
    REQUIRE(cfg.discovery.absolute_floor == 1000);
    REQUIRE(cfg.discovery.always_scan);
    REQUIRE(cfg.state.remote_url == "https://state.example.com/state");
    REQUIRE(cfg.logging.level == 5);
    REQUIRE_FALSE(cfg.logging.append);
    REQUIRE(mgr.validate());

    SECTION("Listing URL comes from the department view")
    {
        REQUIRE(mgr.resolveListingUrl("") == "https://tenant.example.com/views/4/");
        REQUIRE(mgr.resolveListingUrl("planning") == "https://tenant.example.com/views/7/");
        REQUIRE(mgr.resolveListingUrl("unknown").empty());
    }

    SECTION("An explicit listing URL wins")
    {
        mgr.mutableConfig().upstream.listing_url = "https://tenant.example.com/custom";
        REQUIRE(mgr.resolveListingUrl("planning") == "https://tenant.example.com/custom");
    }
}

TEST_CASE("ConfigManager reports malformed files", "[config]")
{
    test_utils::TempDir dir;
    const auto path = dir.path() / "config.toml";
    {
        std::ofstream ofs(path);
        ofs << "[scanner\nbatch_size = ";
    }

    ConfigManager mgr(path.string());
    REQUIRE_FALSE(mgr.load());
    REQUIRE(std::string(mgr.lastError()).find("config parse error") != std::string::npos);
}

TEST_CASE("ConfigManager validation", "[config]")
{
    ConfigManager mgr;
    REQUIRE(mgr.loadFromString(R"(
        [upstream]
        base_url = "https://tenant.example.com"
        tenant_segment = "/jupiterfl/"
    )"));
    REQUIRE(mgr.validate());

    SECTION("Missing tenant segment")
    {
        mgr.mutableConfig().upstream.tenant_segment.clear();
        REQUIRE_FALSE(mgr.validate());
        REQUIRE(std::string(mgr.lastError()).find("tenant_segment") != std::string::npos);
    }

    SECTION("Give-up threshold below the found-then-timeouts threshold")
    {
        mgr.mutableConfig().scanner.give_up_threshold = 10;
        REQUIRE_FALSE(mgr.validate());
    }

    SECTION("Non-positive batch size")
    {
        mgr.mutableConfig().scanner.batch_size = 0;
        REQUIRE_FALSE(mgr.validate());
    }
}

TEST_CASE("ConfigManager applies environment overrides", "[config]")
{
    ConfigManager mgr;
    REQUIRE(mgr.loadFromString("[upstream]\ndefault_department = \"planning\"\n"));

    ::setenv("DEPARTMENT_ID", "city-council", 1);
    ::setenv("CIVICSCAN_STATE_URL", "https://state.example.com/env", 1);
    ::setenv("PUPPETEER_EXECUTABLE_PATH", "/opt/chromium/chrome", 1);
    mgr.applyEnvironment();
    ::unsetenv("DEPARTMENT_ID");
    ::unsetenv("CIVICSCAN_STATE_URL");
    ::unsetenv("PUPPETEER_EXECUTABLE_PATH");

    REQUIRE(mgr.config().upstream.default_department == "city-council");
    REQUIRE(mgr.config().state.remote_url == "https://state.example.com/env");
    REQUIRE(mgr.config().listing.chromium_path == "/opt/chromium/chrome");
}
