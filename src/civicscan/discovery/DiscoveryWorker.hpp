#pragma once

#include "DiscoveryOrchestrator.hpp"

#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>

namespace civicscan
{

struct DiscoveryRequest
{
    std::set<VideoId> alreadyProcessed;
    std::optional<std::string> listingUrl; // overrides the orchestrator's listing page
};

// Runs discovery requests one at a time on a dedicated thread. Each submit()
// returns a future that is the request's completion signal; nothing is detached.
class DiscoveryWorker
{
public:
    explicit DiscoveryWorker(DiscoveryOrchestrator& orchestrator);
    ~DiscoveryWorker();

    DiscoveryWorker(const DiscoveryWorker&) = delete;
    DiscoveryWorker& operator=(const DiscoveryWorker&) = delete;

    std::future<DiscoveryOutcome> submit(DiscoveryRequest request);

    // Finishes queued requests, then joins the worker thread
    void shutdown();

    std::size_t pending() const;

private:
    struct Task
    {
        DiscoveryRequest request;
        std::promise<DiscoveryOutcome> promise;
    };

    void run();

    DiscoveryOrchestrator& orchestrator_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> queue_;
    bool stopping_ = false;
    std::thread thread_;
};

} // namespace civicscan
