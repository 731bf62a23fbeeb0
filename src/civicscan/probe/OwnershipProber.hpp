#pragma once

#include "IProber.hpp"
#include "../http/HttpCommon.hpp"

#include <chrono>
#include <string>

namespace civicscan
{

struct ProberCreateInfo
{
    http::IHttpClient* http = nullptr;

    std::string base_url; // e.g. https://tenant.example.com
    std::string probe_path = "/videos/{id}/download";
    std::string tenant_segment; // matched against the redirect target, e.g. "/jupiterfl/"

    int timeout_ms = 3000;
    int connect_timeout_ms = 3000;
    int retries = 1;
    std::chrono::milliseconds backoff{ 500 };

    SleepFn sleep; // defaults to std::this_thread::sleep_for
};

// HEAD-based ownership probe with a bounded retry loop
class OwnershipProber : public IProber
{
public:
    explicit OwnershipProber(const ProberCreateInfo& create_info);

    ProbeResult probe(VideoId id) override;

    std::string probeUrl(VideoId id) const;

    // Maps one HTTP response to a result; transport failures are not handled here
    ProbeResult classify(VideoId id, const http::HttpResponse& response) const;

private:
    http::IHttpClient* http_;
    std::string base_url_;
    std::string probe_path_;
    std::string tenant_segment_;
    http::SessionConfig session_;
    int retries_;
    std::chrono::milliseconds backoff_;
    SleepFn sleep_;
};

} // namespace civicscan
