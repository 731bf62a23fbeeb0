#include <catch2/catch_test_macros.hpp>
#include "civicscan/state/ScanStateCodec.hpp"
#include "civicscan/state/ScanStateStore.hpp"
#include "../utils/fakes.hpp"

#include <fstream>

using namespace civicscan;
using test_utils::FakeUpstream;
using test_utils::MockHttpClient;
using test_utils::MockResponses;
using test_utils::TempDir;

namespace {

const std::string kStateUrl = "https://state.example.com/state";

ScanState sampleState()
{
    ScanState s;
    s.highestValidId = 1050;
    s.highestScannedId = 1299;
    s.scannedAt = test_utils::fixedNow();
    return s;
}

void writeFile(const std::filesystem::path& path, const std::string& content)
{
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs << content;
}

} // namespace

TEST_CASE("ScanStateCodec encodes and decodes checkpoints", "[scan_state]")
{
    ScanState decoded;
    std::string error;

    SECTION("Round trip keeps ids and timestamp")
    {
        auto text = ScanStateCodec::encode(sampleState());
        REQUIRE(text.find("\"scannedAt\": \"2026-10-18T12:00:00.000Z\"") != std::string::npos);
        REQUIRE(ScanStateCodec::decode(text, decoded, error) == DecodeStatus::State);
        REQUIRE(decoded == sampleState());
    }

    SECTION("Null or missing scannedAt means no state yet")
    {
        REQUIRE(ScanStateCodec::decode(R"({"highestValidId":0,"highestScannedId":0,"scannedAt":null})", decoded,
                                       error) == DecodeStatus::Empty);
        REQUIRE(ScanStateCodec::decode("{}", decoded, error) == DecodeStatus::Empty);
    }

    SECTION("Numeric strings are accepted as ids")
    {
        REQUIRE(ScanStateCodec::decode(
                    R"({"highestValidId":"10","highestScannedId":"20","scannedAt":"2026-10-18T12:00:00Z"})", decoded,
                    error) == DecodeStatus::State);
        REQUIRE(decoded.highestValidId == 10);
        REQUIRE(decoded.highestScannedId == 20);
    }

    SECTION("Malformed payloads are rejected with a reason")
    {
        REQUIRE(ScanStateCodec::decode("not json", decoded, error) == DecodeStatus::Malformed);
        REQUIRE_FALSE(error.empty());
        REQUIRE(ScanStateCodec::decode("[1,2]", decoded, error) == DecodeStatus::Malformed);
        REQUIRE(ScanStateCodec::decode(R"({"highestValidId":"x","highestScannedId":1,"scannedAt":"2026-10-18T12:00:00Z"})",
                                       decoded, error) == DecodeStatus::Malformed);
        REQUIRE(ScanStateCodec::decode(R"({"highestValidId":1,"highestScannedId":1,"scannedAt":"yesterday"})",
                                       decoded, error) == DecodeStatus::Malformed);
    }

    SECTION("highestValidId above highestScannedId is malformed")
    {
        REQUIRE(ScanStateCodec::decode(R"({"highestValidId":30,"highestScannedId":20,"scannedAt":"2026-10-18T12:00:00Z"})",
                                       decoded, error) == DecodeStatus::Malformed);
    }
}

TEST_CASE("ScanStateStore round trips through the remote endpoint", "[scan_state]")
{
    TempDir dir;
    MockHttpClient http;
    FakeUpstream upstream;
    upstream.install(http);

    ScanStateStoreCreateInfo ci;
    ci.http = &http;
    ci.remote_url = kStateUrl;
    ci.local_path = dir.path() / "data" / "last_video_scan.json";
    ScanStateStore store(ci);

    SECTION("Without a prior local file")
    {
        REQUIRE(store.load("video_scanner").status == LoadStatus::Absent);

        REQUIRE(store.save("video_scanner", sampleState()));
        auto loaded = store.load("video_scanner");
        REQUIRE(loaded.status == LoadStatus::Found);
        REQUIRE(loaded.source == StateSource::Remote);
        REQUIRE(loaded.state == sampleState());

        // A successful PUT removes the local copy
        REQUIRE_FALSE(std::filesystem::exists(ci.local_path));
    }

    SECTION("With a stale local file present")
    {
        std::filesystem::create_directories(ci.local_path.parent_path());
        writeFile(ci.local_path, R"({"highestValidId":5,"highestScannedId":9,"scannedAt":"2020-01-01T00:00:00Z"})");

        REQUIRE(store.save("video_scanner", sampleState()));
        auto loaded = store.load("video_scanner");
        REQUIRE(loaded.status == LoadStatus::Found);
        REQUIRE(loaded.state == sampleState());
        REQUIRE_FALSE(std::filesystem::exists(ci.local_path));
    }

    SECTION("The key travels as a query parameter")
    {
        store.save("video scanner", sampleState());
        auto requests = http.requests();
        REQUIRE_FALSE(requests.empty());
        REQUIRE(requests.back().method == "PUT");
        REQUIRE(requests.back().url == kStateUrl + "?key=video%20scanner");
    }
}

TEST_CASE("ScanStateStore treats the remote as authoritative", "[scan_state]")
{
    TempDir dir;
    MockHttpClient http;
    ScanStateStoreCreateInfo ci;
    ci.http = &http;
    ci.remote_url = kStateUrl;
    ci.local_path = dir.path() / "last_video_scan.json";
    writeFile(ci.local_path, ScanStateCodec::encode(sampleState()));
    ScanStateStore store(ci);

    SECTION("Remote empty wins over a local file")
    {
        http.setPatternResponse("/state", MockResponses::json(R"({"scannedAt":null})"));
        REQUIRE(store.load("video_scanner").status == LoadStatus::Absent);
    }

    SECTION("Remote error status is not a fallback trigger")
    {
        http.setPatternResponse("/state", MockResponses::status(500));
        REQUIRE(store.load("video_scanner").status == LoadStatus::Absent);
    }

    SECTION("Malformed remote payload is treated as absent")
    {
        http.setPatternResponse("/state", MockResponses::json("<html>oops</html>"));
        REQUIRE(store.load("video_scanner").status == LoadStatus::Absent);
    }

    SECTION("Unreachable remote falls back to the local file")
    {
        http.simulateNetworkError("connection refused");
        auto loaded = store.load("video_scanner");
        REQUIRE(loaded.status == LoadStatus::Found);
        REQUIRE(loaded.source == StateSource::LocalFile);
        REQUIRE(loaded.state == sampleState());
    }
}

TEST_CASE("ScanStateStore keeps the local file when the remote write fails", "[scan_state]")
{
    TempDir dir;
    MockHttpClient http;
    ScanStateStoreCreateInfo ci;
    ci.http = &http;
    ci.remote_url = kStateUrl;
    ci.local_path = dir.path() / "last_video_scan.json";
    ScanStateStore store(ci);

    SECTION("Transport failure")
    {
        http.simulateNetworkError("timeout");
        REQUIRE(store.save("video_scanner", sampleState()));
        REQUIRE(std::filesystem::exists(ci.local_path));

        auto loaded = store.load("video_scanner");
        REQUIRE(loaded.status == LoadStatus::Found);
        REQUIRE(loaded.source == StateSource::LocalFile);
        REQUIRE(loaded.state == sampleState());
    }

    SECTION("Rejected PUT")
    {
        http.setPatternResponse("/state", MockResponses::status(403));
        REQUIRE(store.save("video_scanner", sampleState()));
        REQUIRE(std::filesystem::exists(ci.local_path));
    }
}

TEST_CASE("ScanStateStore without a remote uses only the local file", "[scan_state]")
{
    TempDir dir;
    ScanStateStoreCreateInfo ci;
    ci.local_path = dir.path() / "nested" / "last_video_scan.json";
    ScanStateStore store(ci);

    REQUIRE(store.load("video_scanner").status == LoadStatus::Absent);
    REQUIRE(store.save("video_scanner", sampleState()));
    REQUIRE(std::filesystem::exists(ci.local_path));

    auto loaded = store.load("video_scanner");
    REQUIRE(loaded.status == LoadStatus::Found);
    REQUIRE(loaded.source == StateSource::LocalFile);

    SECTION("A corrupt local file is ignored")
    {
        writeFile(ci.local_path, "{ truncated");
        REQUIRE(store.load("video_scanner").status == LoadStatus::Absent);
    }
}
