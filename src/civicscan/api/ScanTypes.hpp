#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace civicscan
{

using VideoId = std::int64_t;
using Clock = std::chrono::system_clock;

// Injectable time sources so retry/backoff and checkpoint timestamps are testable
using SleepFn = std::function<void(std::chrono::milliseconds)>;
using NowFn = std::function<Clock::time_point()>;

// Durable checkpoint of how far discovery got.
// highestValidId <= highestScannedId always holds for persisted values.
struct ScanState
{
    VideoId highestValidId = 0;
    VideoId highestScannedId = 0;
    Clock::time_point scannedAt{};

    bool operator==(const ScanState& other) const = default;
};

// Outcome of a single ownership probe. timedOut is never "absent".
struct ProbeResult
{
    VideoId id = 0;
    bool exists = false;
    bool owned = false;
    bool timedOut = false;
};

enum class DiscoveryStatus
{
    Found, // videoId holds the oldest unprocessed owned ID
    NoneFound, // nothing new; an expected outcome
    Failed // neither the listing nor the scan could make progress
};

struct DiscoveryOutcome
{
    DiscoveryStatus status = DiscoveryStatus::NoneFound;
    VideoId videoId = 0;
    std::vector<VideoId> candidates; // ascending
    std::string error;
};

// Process exit codes understood by the pipeline that invokes the scanner
inline constexpr int kExitFound = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitNoNewMeetings = 2;

inline const char* toString(DiscoveryStatus status)
{
    switch (status)
    {
    case DiscoveryStatus::Found:
        return "found";
    case DiscoveryStatus::NoneFound:
        return "none_found";
    case DiscoveryStatus::Failed:
        return "failed";
    }
    return "unknown";
}

} // namespace civicscan
