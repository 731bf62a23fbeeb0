#pragma once

#include <iosfwd>
#include <memory>
#include <optional>
#include <set>
#include <string>

#include "civicscan/api/ScanTypes.hpp"

class ConfigManager;

namespace civicscan
{
class BatchScanner;
class DiscoveryOrchestrator;
class HeadlessChromiumRenderer;
class OwnershipProber;
class PageListingReader;
class ScanStateStore;
namespace http
{
class CprHttpClient;
}
} // namespace civicscan

// Writes the outcome the way the invoking pipeline reads it: the ID alone on `out` when
// found, diagnostics on `err` otherwise. Returns the process exit code.
int ReportOutcome(const civicscan::DiscoveryOutcome& outcome, std::ostream& out, std::ostream& err);

// Command-line front end. Exit codes and the single-line stdout contract are
// defined by civicscan::kExit*; all diagnostics go to stderr.
class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    enum class ArgsResult
    {
        Run,
        ExitOk,
        ExitError
    };

    ArgsResult parseCommandLineArgs();
    bool initializeConfig();
    bool initializeLogging();
    bool loadProcessedIds(std::set<civicscan::VideoId>& out);
    void setupServices();
    int report(const civicscan::DiscoveryOutcome& outcome);
    void printUsage() const;
    void printProblemSummary() const;

    int argc_;
    char** argv_;

    std::string config_path_ = "config.toml";
    std::string department_;
    std::optional<std::string> listing_url_override_;
    std::string processed_list_;
    bool verbose_ = false;

    std::unique_ptr<ConfigManager> config_;
    std::unique_ptr<civicscan::http::CprHttpClient> http_;
    std::unique_ptr<civicscan::OwnershipProber> prober_;
    std::unique_ptr<civicscan::HeadlessChromiumRenderer> renderer_;
    std::unique_ptr<civicscan::PageListingReader> listing_;
    std::unique_ptr<civicscan::ScanStateStore> store_;
    std::unique_ptr<civicscan::BatchScanner> scanner_;
    std::unique_ptr<civicscan::DiscoveryOrchestrator> orchestrator_;
};
