#include "DiscoveryOrchestrator.hpp"

#include <plog/Log.h>

#include <algorithm>

namespace civicscan
{

namespace
{

VideoId highest_processed(const std::set<VideoId>& processed)
{
    return processed.empty() ? 0 : *processed.rbegin();
}

} // namespace

const char* toString(DiscoveryPhase phase)
{
    switch (phase)
    {
    case DiscoveryPhase::FastPath:
        return "FAST_PATH";
    case DiscoveryPhase::FallbackScan:
        return "FALLBACK_SCAN";
    case DiscoveryPhase::Found:
        return "FOUND";
    case DiscoveryPhase::NoneFound:
        return "NONE_FOUND";
    }
    return "UNKNOWN";
}

DiscoveryOrchestrator::DiscoveryOrchestrator(const DiscoveryOrchestratorCreateInfo& create_info)
    : listing_(create_info.listing)
    , prober_(create_info.prober)
    , scanner_(create_info.scanner)
    , store_(create_info.store)
    , state_key_(create_info.state_key)
    , listing_url_(create_info.listing_url)
    , fast_path_cap_(create_info.fast_path_cap)
    , one_month_id_buffer_(create_info.one_month_id_buffer)
    , absolute_floor_(create_info.absolute_floor)
    , overlap_margin_(create_info.overlap_margin)
    , max_range_(create_info.max_range)
    , recent_window_(create_info.recent_window)
    , always_scan_(create_info.always_scan)
    , now_(create_info.now)
{
    if (!now_)
        now_ = [] { return Clock::now(); };
}

void DiscoveryOrchestrator::enter(DiscoveryPhase phase)
{
    PLOG_DEBUG << "Discovery " << toString(phase_) << " -> " << toString(phase);
    phase_ = phase;
}

VideoId DiscoveryOrchestrator::lowerBound(const std::set<VideoId>& alreadyProcessed) const
{
    return std::max(highest_processed(alreadyProcessed) - one_month_id_buffer_, absolute_floor_);
}

VideoId DiscoveryOrchestrator::resumePoint(const LoadResult& loaded, const std::set<VideoId>& alreadyProcessed) const
{
    VideoId start = highest_processed(alreadyProcessed) + 1;

    if (loaded.status == LoadStatus::Found)
    {
        const auto age = now_() - loaded.state.scannedAt;
        if (age <= recent_window_)
        {
            start = loaded.state.highestScannedId - overlap_margin_;
        }
        else
        {
            PLOG_INFO << "Scan state from "
                      << std::chrono::duration_cast<std::chrono::hours>(age).count()
                      << "h ago is stale, resuming after the last processed video";
        }
    }

    return std::max(start, absolute_floor_);
}

std::set<VideoId> DiscoveryOrchestrator::runFastPath(const std::set<VideoId>& alreadyProcessed,
                                                     const std::string& listingUrl, bool& listingReachable)
{
    std::set<VideoId> hits;
    listingReachable = true;

    if (!listing_ || !prober_)
        return hits;
    if (listingUrl.empty())
    {
        PLOG_INFO << "No listing page configured, skipping fast path";
        return hits;
    }

    auto listed = listing_->listCandidates(listingUrl);
    listingReachable = listed.reachable();

    const VideoId floor = lowerBound(alreadyProcessed);
    int probed = 0;
    for (VideoId id : listed.ids)
    {
        if (id < floor || alreadyProcessed.count(id))
            continue;
        if (probed >= fast_path_cap_)
        {
            PLOG_DEBUG << "Fast path cap of " << fast_path_cap_ << " probes reached";
            break;
        }

        ++probed;
        auto result = prober_->probe(id);
        if (result.owned)
        {
            PLOG_INFO << "Fast path: " << id << " belongs to the tenant";
            hits.insert(id);
        }
    }

    PLOG_INFO << "Fast path probed " << probed << " of " << listed.ids.size() << " listed video(s), "
              << hits.size() << " hit(s)";
    return hits;
}

DiscoveryOutcome DiscoveryOrchestrator::discoverNext(const std::set<VideoId>& alreadyProcessed)
{
    return discoverNext(alreadyProcessed, listing_url_);
}

DiscoveryOutcome DiscoveryOrchestrator::discoverNext(const std::set<VideoId>& alreadyProcessed,
                                                     const std::string& listingUrl)
{
    DiscoveryOutcome outcome;
    phase_ = DiscoveryPhase::FastPath;

    bool listing_reachable = true;
    std::set<VideoId> merged = runFastPath(alreadyProcessed, listingUrl, listing_reachable);

    bool scan_made_progress = true;
    if ((merged.empty() || always_scan_) && scanner_)
    {
        enter(DiscoveryPhase::FallbackScan);

        LoadResult loaded;
        if (store_)
            loaded = store_->load(state_key_);

        const VideoId start = resumePoint(loaded, alreadyProcessed);
        std::optional<ScanState> seed;
        if (loaded.status == LoadStatus::Found)
            seed = loaded.state;

        auto scanned = scanner_->scan(start, max_range_, merged, alreadyProcessed, seed);
        scan_made_progress = scanned.responses > 0 || scanned.probesIssued == 0;
        merged.insert(scanned.candidates.begin(), scanned.candidates.end());
    }

    for (VideoId id : alreadyProcessed)
        merged.erase(id);

    outcome.candidates.assign(merged.begin(), merged.end());

    if (!outcome.candidates.empty())
    {
        enter(DiscoveryPhase::Found);
        outcome.status = DiscoveryStatus::Found;
        outcome.videoId = outcome.candidates.front();
        PLOG_INFO << "Oldest unprocessed video: " << outcome.videoId << " (" << outcome.candidates.size()
                  << " candidate(s))";
        return outcome;
    }

    enter(DiscoveryPhase::NoneFound);
    if (!listing_reachable && !scan_made_progress)
    {
        outcome.status = DiscoveryStatus::Failed;
        outcome.error = "listing page unavailable and the upstream did not answer any probe";
        return outcome;
    }

    outcome.status = DiscoveryStatus::NoneFound;
    return outcome;
}

} // namespace civicscan
