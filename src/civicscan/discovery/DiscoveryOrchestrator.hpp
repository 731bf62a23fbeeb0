#pragma once

#include "../api/ScanTypes.hpp"
#include "../listing/PageListingReader.hpp"
#include "../probe/IProber.hpp"
#include "../scanning/BatchScanner.hpp"
#include "../state/ScanStateStore.hpp"

#include <chrono>
#include <set>
#include <string>

namespace civicscan
{

struct DiscoveryOrchestratorCreateInfo
{
    PageListingReader* listing = nullptr;
    IProber* prober = nullptr;
    BatchScanner* scanner = nullptr;
    IScanStateStore* store = nullptr;

    std::string state_key = "video_scanner";
    std::string listing_url;

    int fast_path_cap = 30;
    VideoId one_month_id_buffer = 3000;
    VideoId absolute_floor = 0;
    VideoId overlap_margin = 500;
    VideoId max_range = 10000;
    std::chrono::hours recent_window{ 7 * 24 };
    bool always_scan = false; // run the fallback scan even when the fast path found something

    NowFn now;
};

enum class DiscoveryPhase
{
    FastPath,
    FallbackScan,
    Found,
    NoneFound
};

/**
 * @brief Finds the oldest unprocessed video owned by the tenant
 *
 * FAST_PATH probes the IDs linked from the listing page; FALLBACK_SCAN resumes
 * the batch scanner from the persisted checkpoint. Results of both phases are
 * merged and the smallest ID wins, since downstream ingestion is FIFO.
 */
class DiscoveryOrchestrator
{
public:
    explicit DiscoveryOrchestrator(const DiscoveryOrchestratorCreateInfo& create_info);

    DiscoveryOutcome discoverNext(const std::set<VideoId>& alreadyProcessed);

    // Same, reading the fast path from `listingUrl` for this run only
    DiscoveryOutcome discoverNext(const std::set<VideoId>& alreadyProcessed, const std::string& listingUrl);

    // Lowest ID the fast path will consider
    VideoId lowerBound(const std::set<VideoId>& alreadyProcessed) const;

    // Where the fallback scan starts, given the loaded checkpoint
    VideoId resumePoint(const LoadResult& loaded, const std::set<VideoId>& alreadyProcessed) const;

    DiscoveryPhase lastPhase() const { return phase_; }

private:
    std::set<VideoId> runFastPath(const std::set<VideoId>& alreadyProcessed, const std::string& listingUrl,
                                  bool& listingReachable);

    void enter(DiscoveryPhase phase);

    PageListingReader* listing_;
    IProber* prober_;
    BatchScanner* scanner_;
    IScanStateStore* store_;
    std::string state_key_;
    std::string listing_url_;
    int fast_path_cap_;
    VideoId one_month_id_buffer_;
    VideoId absolute_floor_;
    VideoId overlap_margin_;
    VideoId max_range_;
    std::chrono::hours recent_window_;
    bool always_scan_;
    NowFn now_;

    DiscoveryPhase phase_ = DiscoveryPhase::FastPath;
};

const char* toString(DiscoveryPhase phase);

} // namespace civicscan
