#include <catch2/catch_test_macros.hpp>
#include "civicscan/probe/OwnershipProber.hpp"
#include "../utils/mock_http.hpp"

#include <vector>

using namespace civicscan;
using test_utils::MockHttpClient;
using test_utils::MockResponses;

namespace {

ProberCreateInfo makeInfo(MockHttpClient& http, std::vector<std::chrono::milliseconds>* sleeps = nullptr)
{
    ProberCreateInfo ci;
    ci.http = &http;
    ci.base_url = "https://tenant.example.com/";
    ci.tenant_segment = "/jupiterfl/";
    ci.retries = 1;
    ci.backoff = std::chrono::milliseconds(500);
    ci.sleep = [sleeps](std::chrono::milliseconds d) {
        if (sleeps)
            sleeps->push_back(d);
    };
    return ci;
}

} // namespace

TEST_CASE("OwnershipProber builds probe URLs", "[prober]")
{
    MockHttpClient http;
    OwnershipProber prober(makeInfo(http));

    REQUIRE(prober.probeUrl(1002) == "https://tenant.example.com/videos/1002/download");

    auto ci = makeInfo(http);
    ci.probe_path = "media/";
    OwnershipProber suffix(ci);
    REQUIRE(suffix.probeUrl(7) == "https://tenant.example.com/media/7");
}

TEST_CASE("OwnershipProber classifies responses", "[prober]")
{
    MockHttpClient http;
    OwnershipProber prober(makeInfo(http));

    SECTION("Redirect into the tenant path is owned")
    {
        http.setResponse(prober.probeUrl(1002), MockResponses::redirect("https://cdn.example.com/jupiterfl/a.mp4"));
        auto r = prober.probe(1002);
        REQUIRE(r.id == 1002);
        REQUIRE(r.exists);
        REQUIRE(r.owned);
        REQUIRE_FALSE(r.timedOut);
    }

    SECTION("Redirect elsewhere exists but is foreign")
    {
        http.setResponse(prober.probeUrl(1003), MockResponses::redirect("https://cdn.example.com/otherfl/b.mp4", 301));
        auto r = prober.probe(1003);
        REQUIRE(r.exists);
        REQUIRE_FALSE(r.owned);
        REQUIRE_FALSE(r.timedOut);
    }

    SECTION("404 does not exist")
    {
        http.setResponse(prober.probeUrl(5), MockResponses::not_found());
        auto r = prober.probe(5);
        REQUIRE_FALSE(r.exists);
        REQUIRE_FALSE(r.owned);
        REQUIRE_FALSE(r.timedOut);
    }

    SECTION("Ambiguous statuses never claim ownership")
    {
        http.setResponse(prober.probeUrl(9), MockResponses::status(200, "jupiterfl"));
        auto ok = prober.probe(9);
        REQUIRE(ok.exists);
        REQUIRE_FALSE(ok.owned);

        http.setResponse(prober.probeUrl(10), MockResponses::status(500));
        auto err = prober.probe(10);
        REQUIRE(err.exists);
        REQUIRE_FALSE(err.owned);
        REQUIRE_FALSE(err.timedOut);
    }

    SECTION("Probes are HEAD requests without retries on an answer")
    {
        http.setResponse(prober.probeUrl(11), MockResponses::not_found());
        prober.probe(11);
        REQUIRE(http.requestCount("HEAD") == 1);
        REQUIRE(http.requestCount("GET") == 0);
    }
}

TEST_CASE("OwnershipProber retries transport failures then reports a timeout", "[prober]")
{
    MockHttpClient http;
    std::vector<std::chrono::milliseconds> sleeps;
    OwnershipProber prober(makeInfo(http, &sleeps));

    SECTION("Exhausted retries yield timedOut, never absent")
    {
        http.setResponse(prober.probeUrl(2000), MockResponses::timeout_error());
        auto r = prober.probe(2000);
        REQUIRE(r.timedOut);
        REQUIRE_FALSE(r.exists);
        REQUIRE_FALSE(r.owned);
        REQUIRE(http.requestCount("HEAD") == 2);
        REQUIRE(sleeps.size() == 1);
        REQUIRE(sleeps.front() == std::chrono::milliseconds(500));
    }

    SECTION("Generic network errors are treated like timeouts")
    {
        http.simulateNetworkError("connection refused");
        auto r = prober.probe(2001);
        REQUIRE(r.timedOut);
        REQUIRE_FALSE(r.exists);
    }

    SECTION("A retry that gets an answer is classified normally")
    {
        int attempts = 0;
        http.setHandler([&attempts](const test_utils::RecordedRequest&) {
            return ++attempts == 1 ? MockResponses::timeout_error()
                                   : MockResponses::redirect("https://cdn.example.com/jupiterfl/x.mp4");
        });
        auto r = prober.probe(2002);
        REQUIRE(attempts == 2);
        REQUIRE(r.owned);
        REQUIRE_FALSE(r.timedOut);
    }

    SECTION("Zero retries issues a single attempt")
    {
        auto ci = makeInfo(http, &sleeps);
        ci.retries = 0;
        OwnershipProber once(ci);
        http.setResponse(once.probeUrl(2003), MockResponses::timeout_error());
        REQUIRE(once.probe(2003).timedOut);
        REQUIRE(http.requestCount("HEAD") == 1);
        REQUIRE(sleeps.empty());
    }
}

TEST_CASE("OwnershipProber without a tenant segment never reports ownership", "[prober]")
{
    MockHttpClient http;
    auto ci = makeInfo(http);
    ci.tenant_segment.clear();
    OwnershipProber prober(ci);

    http.setResponse(prober.probeUrl(1), MockResponses::redirect("https://cdn.example.com/jupiterfl/x.mp4"));
    auto r = prober.probe(1);
    REQUIRE(r.exists);
    REQUIRE_FALSE(r.owned);
}
