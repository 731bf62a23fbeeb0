#include "DiscoveryWorker.hpp"

#include <plog/Log.h>

namespace civicscan
{

DiscoveryWorker::DiscoveryWorker(DiscoveryOrchestrator& orchestrator)
    : orchestrator_(orchestrator)
{
    thread_ = std::thread([this] { run(); });
}

DiscoveryWorker::~DiscoveryWorker() { shutdown(); }

std::future<DiscoveryOutcome> DiscoveryWorker::submit(DiscoveryRequest request)
{
    Task task{ std::move(request), {} };
    auto future = task.promise.get_future();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stopping_)
        {
            queue_.push_back(std::move(task));
            cv_.notify_one();
            return future;
        }
    }

    DiscoveryOutcome rejected;
    rejected.status = DiscoveryStatus::Failed;
    rejected.error = "discovery worker is shut down";
    task.promise.set_value(std::move(rejected));
    return future;
}

void DiscoveryWorker::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();

    if (thread_.joinable())
        thread_.join();
}

std::size_t DiscoveryWorker::pending() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void DiscoveryWorker::run()
{
    while (true)
    {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty())
                return;
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        DiscoveryOutcome outcome;
        try
        {
            if (task.request.listingUrl)
                outcome = orchestrator_.discoverNext(task.request.alreadyProcessed, *task.request.listingUrl);
            else
                outcome = orchestrator_.discoverNext(task.request.alreadyProcessed);
        }
        catch (const std::exception& e)
        {
            PLOG_ERROR << "Discovery run failed: " << e.what();
            outcome = DiscoveryOutcome{};
            outcome.status = DiscoveryStatus::Failed;
            outcome.error = e.what();
        }
        task.promise.set_value(std::move(outcome));
    }
}

} // namespace civicscan
