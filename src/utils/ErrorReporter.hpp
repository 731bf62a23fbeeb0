#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace utils
{

enum class ErrorCategory
{
    Configuration, // config.toml, environment, command line
    Network,       // upstream probes and transport failures
    Listing,       // headless rendering of the listing page
    ScanState,     // checkpoint load/save
    Registry       // processed-meetings registry
};

enum class ErrorSeverity
{
    Warning, // run continues with reduced guarantees
    Error,   // one step failed, the run may still produce a result
    Fatal    // the run cannot produce a result
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Configuration;
    ErrorSeverity severity = ErrorSeverity::Warning;
    std::string message;
    std::string details;
    std::chrono::system_clock::time_point at;
};

/**
 * @brief Collects the problems of one run
 *
 * Every report is logged through plog immediately. The CLI prints the collected
 * reports as a summary on stderr before it exits, so a pipeline that only keeps
 * stderr still sees why a run degraded. Safe to call from probe threads.
 */
class ErrorReporter
{
public:
    static void Report(ErrorCategory category, ErrorSeverity severity, const std::string& message,
                       const std::string& details = "");

    static void ReportWarning(ErrorCategory category, const std::string& message, const std::string& details = "");
    static void ReportError(ErrorCategory category, const std::string& message, const std::string& details = "");
    static void ReportFatal(ErrorCategory category, const std::string& message, const std::string& details = "");

    // Reports at or above the given severity
    static std::size_t Count(ErrorSeverity minimum = ErrorSeverity::Warning);

    // Returns the collected reports and starts a fresh collection
    static std::vector<ErrorReport> TakeReports();

    // One line per report, oldest first; empty for no reports
    static std::string Summarize(const std::vector<ErrorReport>& reports);

    static const char* ToString(ErrorCategory category);
    static const char* ToString(ErrorSeverity severity);

private:
    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_reports;
    static constexpr std::size_t kMaxReports = 50;
};

} // namespace utils
