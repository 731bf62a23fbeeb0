#include "LogManager.hpp"
#include "ErrorReporter.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

namespace utils
{

bool LogManager::s_initialized = false;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const Options& options)
{
    if (s_initialized)
        return true;

    try
    {
        std::vector<std::unique_ptr<plog::IAppender>> appenders;

        // Console first so a file that cannot be opened still leaves diagnostics on stderr
        if (options.console)
            appenders.push_back(std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>(plog::streamStdErr));

        if (!options.file.empty())
        {
            std::string error;
            if (!PrepareLogDirectory(options.file, error))
            {
                ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Log file disabled", error);
            }
            else
            {
                if (!options.append)
                    std::ofstream(options.file, std::ios::trunc).close();
                appenders.push_back(std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
                    options.file.c_str(), options.max_file_size, options.backup_count));
            }
        }

        if (appenders.empty())
            return false;

        auto& logger = plog::init(options.level, appenders.front().get());
        logger.setMaxSeverity(options.level); // init() only sets it the first time
        for (std::size_t i = 1; i < appenders.size(); ++i)
            logger.addAppender(appenders[i].get());

        s_appenders = std::move(appenders);
        s_initialized = true;
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Configuration, "Failed to initialize logging", ex.what());
        return false;
    }
}

void LogManager::Shutdown()
{
    if (!s_initialized)
        return;

    // The logger keeps raw appender pointers; silence it before they go away
    if (auto* logger = plog::get())
        logger->setMaxSeverity(plog::none);
    s_appenders.clear();
    s_initialized = false;
}

bool LogManager::PrepareLogDirectory(const std::string& filepath, std::string& outError)
{
    auto dir = std::filesystem::path(filepath).parent_path();
    if (dir.empty())
        return true;

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        outError = "cannot create " + dir.string() + ": " + ec.message();
        return false;
    }
    return true;
}

plog::Severity LogManager::SeverityFromLevel(int level, bool verbose)
{
    if (verbose)
        return plog::debug;
    if (level < plog::none || level > plog::verbose)
        return plog::info;
    return static_cast<plog::Severity>(level);
}

} // namespace utils
