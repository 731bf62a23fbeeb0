#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace utils
{

struct CaptureResult
{
    bool started = false;
    bool timed_out = false;
    int exit_code = -1;
    std::string output; // child's stdout
    std::string error;
};

// POSIX process helpers
class ProcessUtils
{
public:
    // Run a process to completion, capturing stdout (stderr is discarded).
    // The child is killed with SIGKILL when the deadline passes.
    static CaptureResult RunAndCapture(const std::filesystem::path& exePath, const std::vector<std::string>& args,
                                       std::chrono::milliseconds timeout);

    // Locate a Chromium/Chrome binary: PUPPETEER_EXECUTABLE_PATH, the Nix store,
    // then well-known install paths. Empty when nothing is found.
    static std::filesystem::path FindChromiumPath();
};

} // namespace utils
