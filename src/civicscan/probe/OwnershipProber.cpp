#include "OwnershipProber.hpp"

#include <plog/Log.h>

#include <thread>

namespace civicscan
{

OwnershipProber::OwnershipProber(const ProberCreateInfo& create_info)
    : http_(create_info.http)
    , base_url_(create_info.base_url)
    , probe_path_(create_info.probe_path)
    , tenant_segment_(create_info.tenant_segment)
    , retries_(create_info.retries < 0 ? 0 : create_info.retries)
    , backoff_(create_info.backoff)
    , sleep_(create_info.sleep)
{
    session_.timeout_ms = create_info.timeout_ms;
    session_.connect_timeout_ms = create_info.connect_timeout_ms;
    session_.follow_redirects = false;

    while (!base_url_.empty() && base_url_.back() == '/')
        base_url_.pop_back();

    if (!sleep_)
    {
        sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

std::string OwnershipProber::probeUrl(VideoId id) const
{
    std::string path = probe_path_;
    const std::string token = "{id}";
    auto pos = path.find(token);
    if (pos != std::string::npos)
        path.replace(pos, token.size(), std::to_string(id));
    else
        path += std::to_string(id);

    if (!path.empty() && path.front() != '/')
        path.insert(path.begin(), '/');
    return base_url_ + path;
}

ProbeResult OwnershipProber::classify(VideoId id, const http::HttpResponse& response) const
{
    ProbeResult result;
    result.id = id;

    if (response.isRedirect())
    {
        result.exists = true;
        result.owned = !tenant_segment_.empty() && response.location.find(tenant_segment_) != std::string::npos;
        return result;
    }

    if (response.status_code == 404)
    {
        result.exists = false;
        return result;
    }

    // Ambiguous statuses never claim ownership
    result.exists = true;
    result.owned = false;
    return result;
}

ProbeResult OwnershipProber::probe(VideoId id)
{
    if (!http_)
    {
        PLOG_ERROR << "OwnershipProber: no HTTP client configured";
        ProbeResult failed;
        failed.id = id;
        failed.timedOut = true;
        return failed;
    }

    const std::string url = probeUrl(id);
    std::string last_error;

    for (int attempt = 0; attempt <= retries_; ++attempt)
    {
        if (attempt > 0)
            sleep_(backoff_);

        auto response = http_->head(url, session_);
        if (!response.transportFailed())
        {
            auto result = classify(id, response);
            PLOG_VERBOSE << "probe " << id << " -> status " << response.status_code
                         << (result.owned ? " (owned)" : "");
            return result;
        }
        last_error = response.error;
    }

    PLOG_DEBUG << "probe " << id << " timed out after " << (retries_ + 1) << " attempt(s): " << last_error;
    ProbeResult timed_out;
    timed_out.id = id;
    timed_out.timedOut = true;
    return timed_out;
}

} // namespace civicscan
