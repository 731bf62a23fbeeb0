#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

// Owns the plog appenders of the process. Console output goes to stderr only:
// stdout carries nothing but the discovered video ID.
class LogManager
{
public:
    struct Options
    {
        plog::Severity level = plog::info;
        std::string file; // empty disables the file appender
        bool append = true;
        std::size_t max_file_size = 10 * 1024 * 1024;
        int backup_count = 3;
        bool console = true;
    };

    static bool Initialize(const Options& options);
    static bool IsInitialized() { return s_initialized; }

    // Silences the logger and destroys the appenders
    static void Shutdown();

    static bool PrepareLogDirectory(const std::string& filepath, std::string& outError);

    // Maps the config's 0-6 level (plog numbering) and --verbose to a severity
    static plog::Severity SeverityFromLevel(int level, bool verbose);

private:
    LogManager() = default;

    static bool s_initialized;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
