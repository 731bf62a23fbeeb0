#include "Application.hpp"
#include "config/ConfigManager.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"
#include "civicscan/http/HttpCommon.hpp"
#include "civicscan/probe/OwnershipProber.hpp"
#include "civicscan/listing/HeadlessChromiumRenderer.hpp"
#include "civicscan/listing/PageListingReader.hpp"
#include "civicscan/state/ScanStateStore.hpp"
#include "civicscan/scanning/BatchScanner.hpp"
#include "civicscan/discovery/DiscoveryOrchestrator.hpp"
#include "civicscan/discovery/DiscoveryWorker.hpp"
#include "civicscan/discovery/ProcessedRegistry.hpp"

#include <plog/Log.h>

#include <cstring>
#include <iostream>

#ifndef CIVICSCAN_VERSION_STRING
#define CIVICSCAN_VERSION_STRING "0.0.0-dev"
#endif

using namespace civicscan;

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() = default;

void Application::printUsage() const
{
    std::cerr << "Usage: " << (argc_ > 0 ? argv_[0] : "civicscan") << " [OPTIONS]\n";
    std::cerr << "Find the oldest unprocessed meeting video owned by the configured tenant.\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --config <path>        Configuration file (default: config.toml)\n";
    std::cerr << "  --department <id>      Department whose listing page is used for the fast path\n";
    std::cerr << "  --listing-url <url>    Listing page URL (overrides the department)\n";
    std::cerr << "  --processed <ids>      Extra processed IDs, comma separated\n";
    std::cerr << "  --verbose              Debug logging\n";
    std::cerr << "  --version              Show version information\n";
    std::cerr << "  --help                 Show this help message\n";
    std::cerr << "\nExit codes: " << kExitFound << " = ID printed on stdout, " << kExitNoNewMeetings
              << " = no new meetings, " << kExitFailure << " = error.\n";
}

Application::ArgsResult Application::parseCommandLineArgs()
{
    for (int i = 1; i < argc_; ++i)
    {
        const char* arg = argv_[i];
        auto next = [&](const char* name) -> const char*
        {
            if (i + 1 >= argc_)
            {
                std::cerr << name << " requires a value\n";
                return nullptr;
            }
            return argv_[++i];
        };

        if (std::strcmp(arg, "--help") == 0)
        {
            printUsage();
            return ArgsResult::ExitOk;
        }
        else if (std::strcmp(arg, "--version") == 0)
        {
            std::cerr << "civicscan " << CIVICSCAN_VERSION_STRING << "\n";
            return ArgsResult::ExitOk;
        }
        else if (std::strcmp(arg, "--verbose") == 0)
        {
            verbose_ = true;
        }
        else if (std::strcmp(arg, "--config") == 0)
        {
            const char* v = next(arg);
            if (!v)
                return ArgsResult::ExitError;
            config_path_ = v;
        }
        else if (std::strcmp(arg, "--department") == 0)
        {
            const char* v = next(arg);
            if (!v)
                return ArgsResult::ExitError;
            department_ = v;
        }
        else if (std::strcmp(arg, "--listing-url") == 0)
        {
            const char* v = next(arg);
            if (!v)
                return ArgsResult::ExitError;
            listing_url_override_ = v;
        }
        else if (std::strcmp(arg, "--processed") == 0)
        {
            const char* v = next(arg);
            if (!v)
                return ArgsResult::ExitError;
            processed_list_ = v;
        }
        else
        {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage();
            return ArgsResult::ExitError;
        }
    }
    return ArgsResult::Run;
}

bool Application::initializeConfig()
{
    config_ = std::make_unique<ConfigManager>(config_path_);
    if (!config_->load())
        return false;
    config_->applyEnvironment();
    if (!department_.empty())
        config_->mutableConfig().upstream.default_department = department_;
    if (verbose_)
        config_->mutableConfig().logging.verbose = true;
    return config_->validate();
}

bool Application::initializeLogging()
{
    const auto& logging = config_->config().logging;

    utils::LogManager::Options options;
    options.level = utils::LogManager::SeverityFromLevel(logging.level, logging.verbose);
    options.file = logging.file;
    options.append = logging.append;
    return utils::LogManager::Initialize(options);
}

bool Application::loadProcessedIds(std::set<VideoId>& out)
{
    std::string error;
    if (!ProcessedRegistry::loadFile(config_->config().registry.meetings_path, out, error))
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Registry, "Cannot read the meetings registry", error);
        return false;
    }
    if (!processed_list_.empty() && !ProcessedRegistry::parseIdList(processed_list_, out, error))
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Configuration, "Invalid --processed value", error);
        return false;
    }
    PLOG_INFO << out.size() << " video(s) already processed";
    return true;
}

void Application::setupServices()
{
    const auto& cfg = config_->config();

    http_ = std::make_unique<http::CprHttpClient>("civicscan/" CIVICSCAN_VERSION_STRING);

    ProberCreateInfo prober_info;
    prober_info.http = http_.get();
    prober_info.base_url = cfg.upstream.base_url;
    prober_info.probe_path = cfg.upstream.probe_path;
    prober_info.tenant_segment = cfg.upstream.tenant_segment;
    prober_info.timeout_ms = cfg.probe.timeout_ms;
    prober_info.connect_timeout_ms = cfg.probe.connect_timeout_ms;
    prober_info.retries = cfg.probe.retries;
    prober_info.backoff = std::chrono::milliseconds{ cfg.probe.backoff_ms };
    prober_ = std::make_unique<OwnershipProber>(prober_info);

    renderer_ = std::make_unique<HeadlessChromiumRenderer>(cfg.listing.chromium_path);
    listing_ = std::make_unique<PageListingReader>(renderer_.get(),
                                                   std::chrono::milliseconds{ cfg.listing.render_timeout_ms });

    ScanStateStoreCreateInfo store_info;
    store_info.http = http_.get();
    store_info.remote_url = cfg.state.remote_url;
    store_info.remote_timeout_ms = cfg.state.remote_timeout_ms;
    store_info.local_path = cfg.state.local_path;
    store_ = std::make_unique<ScanStateStore>(store_info);

    BatchScannerCreateInfo scanner_info;
    scanner_info.prober = prober_.get();
    scanner_info.store = store_.get();
    scanner_info.state_key = cfg.state.key;
    scanner_info.batch_size = cfg.scanner.batch_size;
    scanner_info.inter_batch_delay = std::chrono::milliseconds{ cfg.scanner.inter_batch_delay_ms };
    scanner_info.timeout_run_threshold = cfg.scanner.timeout_run_threshold;
    scanner_info.give_up_threshold = cfg.scanner.give_up_threshold;
    scanner_ = std::make_unique<BatchScanner>(scanner_info);

    DiscoveryOrchestratorCreateInfo disc_info;
    disc_info.listing = listing_.get();
    disc_info.prober = prober_.get();
    disc_info.scanner = scanner_.get();
    disc_info.store = store_.get();
    disc_info.state_key = cfg.state.key;
    disc_info.listing_url = listing_url_override_ ? *listing_url_override_ : config_->resolveListingUrl(department_);
    disc_info.fast_path_cap = cfg.discovery.fast_path_cap;
    disc_info.one_month_id_buffer = cfg.discovery.one_month_id_buffer;
    disc_info.absolute_floor = cfg.discovery.absolute_floor;
    disc_info.overlap_margin = cfg.discovery.overlap_margin;
    disc_info.max_range = cfg.scanner.max_range;
    disc_info.recent_window = std::chrono::hours{ cfg.discovery.recent_window_hours };
    disc_info.always_scan = cfg.discovery.always_scan;
    orchestrator_ = std::make_unique<DiscoveryOrchestrator>(disc_info);
}

int ReportOutcome(const DiscoveryOutcome& outcome, std::ostream& out, std::ostream& err)
{
    switch (outcome.status)
    {
    case DiscoveryStatus::Found:
        out << outcome.videoId << std::endl;
        return kExitFound;
    case DiscoveryStatus::NoneFound:
        err << "NO_NEW_MEETINGS: no unprocessed videos owned by the tenant were found\n";
        return kExitNoNewMeetings;
    case DiscoveryStatus::Failed:
        break;
    }

    err << "Error: discovery failed";
    if (!outcome.error.empty())
        err << ": " << outcome.error;
    err << "\n";
    return kExitFailure;
}

int Application::report(const DiscoveryOutcome& outcome)
{
    if (outcome.status == DiscoveryStatus::Failed)
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Network, "Discovery failed", outcome.error);
    return ReportOutcome(outcome, std::cout, std::cerr);
}

int Application::run()
{
    switch (parseCommandLineArgs())
    {
    case ArgsResult::ExitOk:
        return 0;
    case ArgsResult::ExitError:
        return kExitFailure;
    case ArgsResult::Run:
        break;
    }

    // Logging needs the config; a config error is reported before plog exists
    if (!initializeConfig())
    {
        std::cerr << "Error: " << config_->lastError() << "\n";
        return kExitFailure;
    }
    if (!initializeLogging())
    {
        std::cerr << "Error: could not initialize logging\n";
        return kExitFailure;
    }

    std::set<VideoId> processed;
    if (!loadProcessedIds(processed))
    {
        printProblemSummary();
        return kExitFailure;
    }

    setupServices();

    DiscoveryWorker worker(*orchestrator_);
    DiscoveryRequest request;
    request.alreadyProcessed = std::move(processed);
    auto outcome = worker.submit(std::move(request)).get();
    worker.shutdown();

    int code = report(outcome);
    printProblemSummary();
    utils::LogManager::Shutdown();
    return code;
}

void Application::printProblemSummary() const
{
    const auto reports = utils::ErrorReporter::TakeReports();
    if (!reports.empty())
        std::cerr << utils::ErrorReporter::Summarize(reports);
}
