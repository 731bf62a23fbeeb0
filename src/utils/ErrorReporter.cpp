#include "ErrorReporter.hpp"
#include "TimeFormat.hpp"

#include <plog/Log.h>

#include <sstream>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::vector<ErrorReport> ErrorReporter::s_reports;

void ErrorReporter::Report(ErrorCategory category, ErrorSeverity severity, const std::string& message,
                           const std::string& details)
{
    std::string line = std::string("[") + ToString(category) + "] " + message;
    if (!details.empty())
        line += ": " + details;

    switch (severity)
    {
    case ErrorSeverity::Warning:
        PLOG_WARNING << line;
        break;
    case ErrorSeverity::Error:
        PLOG_ERROR << line;
        break;
    case ErrorSeverity::Fatal:
        PLOG_FATAL << line;
        break;
    }

    std::lock_guard<std::mutex> lock(s_mutex);
    // Keep the first reports; later ones are usually repeats of the same failure
    if (s_reports.size() >= kMaxReports)
        return;
    s_reports.push_back(ErrorReport{ category, severity, message, details, std::chrono::system_clock::now() });
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& message, const std::string& details)
{
    Report(category, ErrorSeverity::Warning, message, details);
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& message, const std::string& details)
{
    Report(category, ErrorSeverity::Error, message, details);
}

void ErrorReporter::ReportFatal(ErrorCategory category, const std::string& message, const std::string& details)
{
    Report(category, ErrorSeverity::Fatal, message, details);
}

std::size_t ErrorReporter::Count(ErrorSeverity minimum)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::size_t n = 0;
    for (const auto& r : s_reports)
    {
        if (r.severity >= minimum)
            ++n;
    }
    return n;
}

std::vector<ErrorReport> ErrorReporter::TakeReports()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> taken;
    taken.swap(s_reports);
    return taken;
}

std::string ErrorReporter::Summarize(const std::vector<ErrorReport>& reports)
{
    if (reports.empty())
        return {};

    std::ostringstream out;
    out << reports.size() << " problem(s) during this run:\n";
    for (const auto& r : reports)
    {
        out << "  " << FormatIso8601(r.at) << ' ' << ToString(r.severity) << " [" << ToString(r.category) << "] "
            << r.message;
        if (!r.details.empty())
            out << " (" << r.details << ')';
        out << '\n';
    }
    return out.str();
}

const char* ErrorReporter::ToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Configuration:
        return "config";
    case ErrorCategory::Network:
        return "network";
    case ErrorCategory::Listing:
        return "listing";
    case ErrorCategory::ScanState:
        return "scan-state";
    case ErrorCategory::Registry:
        return "registry";
    }
    return "unknown";
}

const char* ErrorReporter::ToString(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Warning:
        return "warning";
    case ErrorSeverity::Error:
        return "error";
    case ErrorSeverity::Fatal:
        return "fatal";
    }
    return "unknown";
}

} // namespace utils
