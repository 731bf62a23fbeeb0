#include "BatchScanner.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <system_error>
#include <thread>

namespace civicscan
{

namespace
{

ProbeResult run_probe(IProber& prober, VideoId id)
{
    try
    {
        return prober.probe(id);
    }
    catch (const std::exception& e)
    {
        PLOG_ERROR << "probe " << id << " threw: " << e.what();
        ProbeResult failed;
        failed.id = id;
        failed.timedOut = true;
        return failed;
    }
}

} // namespace

const char* toString(StopReason reason)
{
    switch (reason)
    {
    case StopReason::RangeExhausted:
        return "range exhausted";
    case StopReason::FoundThenTimeouts:
        return "found candidates, then timeouts";
    case StopReason::PastEndOfRange:
        return "past end of valid IDs";
    }
    return "unknown";
}

BatchScanner::BatchScanner(const BatchScannerCreateInfo& create_info)
    : prober_(create_info.prober)
    , store_(create_info.store)
    , state_key_(create_info.state_key)
    , batch_size_(std::max(1, create_info.batch_size))
    , inter_batch_delay_(create_info.inter_batch_delay)
    , timeout_run_threshold_(create_info.timeout_run_threshold)
    , give_up_threshold_(create_info.give_up_threshold)
    , sleep_(create_info.sleep)
    , now_(create_info.now)
{
    if (!sleep_)
        sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    if (!now_)
        now_ = [] { return Clock::now(); };
}

std::vector<ProbeResult> BatchScanner::runBatch(VideoId first, VideoId last, const std::set<VideoId>& alreadyOwned)
{
    const auto count = static_cast<std::size_t>(last - first + 1);
    std::vector<ProbeResult> results(count);
    std::vector<std::thread> workers;
    workers.reserve(count);

    for (std::size_t i = 0; i < count; ++i)
    {
        const VideoId id = first + static_cast<VideoId>(i);
        if (alreadyOwned.count(id))
        {
            results[i] = ProbeResult{ id, true, true, false };
            continue;
        }

        try
        {
            workers.emplace_back([this, &results, i, id] { results[i] = run_probe(*prober_, id); });
        }
        catch (const std::system_error& e)
        {
            PLOG_WARNING << "Could not start probe worker for " << id << " (" << e.what() << "), probing inline";
            results[i] = run_probe(*prober_, id);
        }
    }

    for (auto& worker : workers)
        worker.join();

    return results;
}

void BatchScanner::foldBatch(ScanProgress& progress, const std::vector<ProbeResult>& results,
                             const std::set<VideoId>& alreadyProcessed)
{
    for (const auto& r : results)
    {
        progress.highestScannedId = std::max(progress.highestScannedId, r.id);

        if (r.timedOut)
        {
            ++progress.consecutiveTimeouts;
            continue;
        }

        ++progress.responses;
        if (!r.exists)
            continue;

        progress.highestValidId = std::max(progress.highestValidId, r.id);
        progress.consecutiveTimeouts = 0;

        if (r.owned && !alreadyProcessed.count(r.id))
        {
            auto pos = std::lower_bound(progress.candidates.begin(), progress.candidates.end(), r.id);
            if (pos == progress.candidates.end() || *pos != r.id)
                progress.candidates.insert(pos, r.id);
        }
    }
}

std::optional<StopReason> BatchScanner::checkTermination(const ScanProgress& progress) const
{
    if (progress.consecutiveTimeouts >= give_up_threshold_)
        return StopReason::PastEndOfRange;
    if (!progress.candidates.empty() && progress.consecutiveTimeouts >= timeout_run_threshold_)
        return StopReason::FoundThenTimeouts;
    return std::nullopt;
}

ScanOutcome BatchScanner::scan(VideoId startId, VideoId maxRange, const std::set<VideoId>& alreadyOwned,
                               const std::set<VideoId>& alreadyProcessed, const std::optional<ScanState>& seed)
{
    ScanProgress progress;
    if (seed)
    {
        progress.highestValidId = seed->highestValidId;
        progress.highestScannedId = seed->highestScannedId;
    }

    ScanOutcome outcome;
    const VideoId endId = startId + std::max<VideoId>(0, maxRange);

    if (!prober_)
    {
        PLOG_ERROR << "BatchScanner: no prober configured";
    }
    else
    {
        PLOG_INFO << "Scanning IDs " << startId << ".." << endId << " in batches of " << batch_size_;

        for (VideoId batch_start = startId; batch_start <= endId; batch_start += batch_size_)
        {
            if (batch_start != startId && inter_batch_delay_.count() > 0)
                sleep_(inter_batch_delay_);

            const VideoId batch_end = std::min<VideoId>(batch_start + batch_size_ - 1, endId);
            auto results = runBatch(batch_start, batch_end, alreadyOwned);
            progress.probesIssued += results.size();
            foldBatch(progress, results, alreadyProcessed);

            PLOG_DEBUG << "Batch " << batch_start << ".." << batch_end << ": highestValid=" << progress.highestValidId
                       << " consecutiveTimeouts=" << progress.consecutiveTimeouts
                       << " candidates=" << progress.candidates.size();

            if (auto stop = checkTermination(progress))
            {
                outcome.stopReason = *stop;
                break;
            }
        }
    }

    outcome.candidates = progress.candidates;
    outcome.probesIssued = progress.probesIssued;
    outcome.responses = progress.responses;
    outcome.finalState.highestValidId = progress.highestValidId;
    outcome.finalState.highestScannedId = progress.highestScannedId;
    // Milliseconds, the precision the checkpoint is persisted with
    outcome.finalState.scannedAt = std::chrono::time_point_cast<std::chrono::milliseconds>(now_());

    PLOG_INFO << "Scan stopped (" << toString(outcome.stopReason) << ") after " << outcome.probesIssued
              << " probes: highestValid=" << outcome.finalState.highestValidId
              << " highestScanned=" << outcome.finalState.highestScannedId
              << " candidates=" << outcome.candidates.size();

    if (store_)
        outcome.stateSaved = store_->save(state_key_, outcome.finalState);
    else
        PLOG_WARNING << "BatchScanner: no scan-state store, checkpoint not persisted";

    return outcome;
}

} // namespace civicscan
