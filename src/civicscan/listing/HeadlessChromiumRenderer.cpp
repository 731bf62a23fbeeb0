#include "HeadlessChromiumRenderer.hpp"
#include "../../platform/ProcessUtils.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <string>
#include <vector>

namespace civicscan
{

HeadlessChromiumRenderer::HeadlessChromiumRenderer(std::filesystem::path chromium_path)
    : chromium_path_(std::move(chromium_path))
{
}

RenderResult HeadlessChromiumRenderer::render(const std::string& url, std::chrono::milliseconds timeout)
{
    RenderResult result;

    auto exe = chromium_path_.empty() ? utils::ProcessUtils::FindChromiumPath() : chromium_path_;
    if (exe.empty())
    {
        result.error = "no Chromium executable found (set listing.chromium_path or PUPPETEER_EXECUTABLE_PATH)";
        return result;
    }
    PLOG_DEBUG << "Using Chromium at: " << exe.string();

    // Leave part of the deadline for process startup and DOM serialization
    const auto budget = std::max<long long>(1000, timeout.count() * 3 / 4);
    std::vector<std::string> args = {
        "--headless",
        "--no-sandbox",
        "--disable-setuid-sandbox",
        "--disable-dev-shm-usage",
        "--disable-gpu",
        "--virtual-time-budget=" + std::to_string(budget),
        "--dump-dom",
        url,
    };

    utils::CaptureResult capture = utils::ProcessUtils::RunAndCapture(exe, args, timeout);
    if (capture.timed_out)
    {
        result.error = "rendering " + url + " timed out after " + std::to_string(timeout.count()) + " ms";
        return result;
    }
    if (!capture.started)
    {
        result.error = "could not start " + exe.string() + ": " + capture.error;
        return result;
    }
    if (capture.exit_code != 0)
    {
        result.error = "Chromium exited with code " + std::to_string(capture.exit_code);
        return result;
    }
    if (capture.output.empty())
    {
        result.error = "Chromium returned an empty document";
        return result;
    }

    result.ok = true;
    result.html = std::move(capture.output);
    return result;
}

} // namespace civicscan
