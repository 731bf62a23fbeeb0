#pragma once

#include "../api/ScanTypes.hpp"
#include "../probe/IProber.hpp"
#include "../state/ScanStateStore.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace civicscan
{

struct BatchScannerCreateInfo
{
    IProber* prober = nullptr;
    IScanStateStore* store = nullptr;
    std::string state_key = "video_scanner";

    int batch_size = 100;
    std::chrono::milliseconds inter_batch_delay{ 10 };

    // Rule A: stop once something was found and this many probes in a row timed out
    int timeout_run_threshold = 200;
    // Rule B: stop after this many timeouts in a row regardless of findings
    int give_up_threshold = 400;

    SleepFn sleep;
    NowFn now;
};

enum class StopReason
{
    RangeExhausted,
    FoundThenTimeouts, // rule A
    PastEndOfRange // rule B
};

// Running counters of one scan. Only the scanner's control loop writes to it.
struct ScanProgress
{
    VideoId highestValidId = 0;
    VideoId highestScannedId = 0;
    int consecutiveTimeouts = 0;
    std::vector<VideoId> candidates; // owned and unprocessed, ascending
    std::size_t probesIssued = 0;
    std::size_t responses = 0; // results that were not timeouts
};

struct ScanOutcome
{
    std::vector<VideoId> candidates;
    ScanState finalState;
    StopReason stopReason = StopReason::RangeExhausted;
    std::size_t probesIssued = 0;
    std::size_t responses = 0;
    bool stateSaved = false;
};

/**
 * @brief Walks [startId, startId + maxRange] in sequential, internally concurrent batches
 *
 * Every ID of a batch is probed on its own worker thread; the batch is joined
 * before its results are folded and before any termination rule is checked.
 * The final checkpoint is handed to the scan-state store exactly once.
 */
class BatchScanner
{
public:
    explicit BatchScanner(const BatchScannerCreateInfo& create_info);

    ScanOutcome scan(VideoId startId, VideoId maxRange, const std::set<VideoId>& alreadyOwned,
                     const std::set<VideoId>& alreadyProcessed, const std::optional<ScanState>& seed = std::nullopt);

    // Folds one joined batch (ascending IDs) into the running counters
    static void foldBatch(ScanProgress& progress, const std::vector<ProbeResult>& results,
                          const std::set<VideoId>& alreadyProcessed);

    std::optional<StopReason> checkTermination(const ScanProgress& progress) const;

private:
    std::vector<ProbeResult> runBatch(VideoId first, VideoId last, const std::set<VideoId>& alreadyOwned);

    IProber* prober_;
    IScanStateStore* store_;
    std::string state_key_;
    int batch_size_;
    std::chrono::milliseconds inter_batch_delay_;
    int timeout_run_threshold_;
    int give_up_threshold_;
    SleepFn sleep_;
    NowFn now_;
};

const char* toString(StopReason reason);

} // namespace civicscan
