#pragma once

#include "IPageRenderer.hpp"

#include <filesystem>

namespace civicscan
{

// Runs `chromium --headless --dump-dom <url>` and captures stdout
class HeadlessChromiumRenderer : public IPageRenderer
{
public:
    explicit HeadlessChromiumRenderer(std::filesystem::path chromium_path = {});

    RenderResult render(const std::string& url, std::chrono::milliseconds timeout) override;

private:
    std::filesystem::path chromium_path_;
};

} // namespace civicscan
