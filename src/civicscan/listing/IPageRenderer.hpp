#pragma once

#include <chrono>
#include <string>

namespace civicscan
{

struct RenderResult
{
    bool ok = false;
    std::string html; // DOM after client-side scripts ran
    std::string error;
};

// Produces the rendered DOM of a page whose links are populated by scripts
class IPageRenderer
{
public:
    virtual ~IPageRenderer() = default;

    virtual RenderResult render(const std::string& url, std::chrono::milliseconds timeout) = 0;
};

} // namespace civicscan
