#pragma once

#include "IPageRenderer.hpp"
#include "../api/ScanTypes.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace civicscan
{

struct ListingResult
{
    std::vector<VideoId> ids; // deduplicated, page order
    std::string error; // set when the page could not be rendered

    bool reachable() const { return error.empty(); }
};

// Fast path: IDs of recent videos linked from the tenant's listing page.
// The listing may be stale; an empty result means "fall back to scanning".
class PageListingReader
{
public:
    PageListingReader(IPageRenderer* renderer, std::chrono::milliseconds timeout);

    ListingResult listCandidates(const std::string& listingUrl);

    // Extracts IDs from anchors whose href contains /videos/<digits>
    static std::vector<VideoId> extractVideoIds(const std::string& html);

private:
    IPageRenderer* renderer_;
    std::chrono::milliseconds timeout_;
};

} // namespace civicscan
