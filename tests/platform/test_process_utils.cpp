#include <catch2/catch_test_macros.hpp>
#include "platform/ProcessUtils.hpp"
#include "civicscan/listing/HeadlessChromiumRenderer.hpp"
#include "civicscan/listing/PageListingReader.hpp"
#include "../utils/fakes.hpp"

#include <fstream>

using utils::ProcessUtils;

namespace {

// Writes an executable shell script standing in for a browser binary
std::filesystem::path writeScript(const std::filesystem::path& dir, const std::string& body)
{
    auto path = dir / "fake-chromium";
    {
        std::ofstream ofs(path);
        ofs << "#!/bin/sh\n" << body << "\n";
    }
    std::filesystem::permissions(path, std::filesystem::perms::owner_all);
    return path;
}

} // namespace

TEST_CASE("RunAndCapture collects stdout and the exit code", "[process]")
{
    auto result = ProcessUtils::RunAndCapture("/bin/sh", { "-c", "echo hello; echo oops >&2; exit 3" },
                                              std::chrono::seconds(10));
    REQUIRE(result.started);
    REQUIRE_FALSE(result.timed_out);
    REQUIRE(result.output == "hello\n");
    REQUIRE(result.exit_code == 3);
}

TEST_CASE("RunAndCapture kills processes that overrun the deadline", "[process]")
{
    auto result = ProcessUtils::RunAndCapture("/bin/sh", { "-c", "sleep 30" }, std::chrono::milliseconds(200));
    REQUIRE(result.started);
    REQUIRE(result.timed_out);
}

TEST_CASE("RunAndCapture rejects missing executables", "[process]")
{
    auto result = ProcessUtils::RunAndCapture("/nonexistent/chromium", {}, std::chrono::seconds(1));
    REQUIRE_FALSE(result.started);
    REQUIRE_FALSE(result.error.empty());
}

TEST_CASE("HeadlessChromiumRenderer returns the dumped DOM", "[process][listing]")
{
    test_utils::TempDir dir;

    SECTION("Successful dump feeds the listing reader")
    {
        auto exe = writeScript(dir.path(), "echo '<html><a href=\"/videos/321\">Meeting</a></html>'");
        civicscan::HeadlessChromiumRenderer renderer(exe);
        civicscan::PageListingReader reader(&renderer, std::chrono::seconds(10));

        auto listed = reader.listCandidates("https://tenant.example.com/views/4/");
        REQUIRE(listed.reachable());
        REQUIRE(listed.ids == std::vector<civicscan::VideoId>{ 321 });
    }

    SECTION("The URL is passed as the last argument")
    {
        auto exe = writeScript(dir.path(), "eval last=\\${$#}; echo \"$last\"");
        civicscan::HeadlessChromiumRenderer renderer(exe);
        auto rendered = renderer.render("https://tenant.example.com/views/4/", std::chrono::seconds(10));
        REQUIRE(rendered.ok);
        REQUIRE(rendered.html == "https://tenant.example.com/views/4/\n");
    }

    SECTION("Non-zero exit is a render failure")
    {
        auto exe = writeScript(dir.path(), "exit 1");
        civicscan::HeadlessChromiumRenderer renderer(exe);
        auto rendered = renderer.render("https://tenant.example.com/", std::chrono::seconds(10));
        REQUIRE_FALSE(rendered.ok);
        REQUIRE_FALSE(rendered.error.empty());
    }

    SECTION("Empty output is a render failure")
    {
        auto exe = writeScript(dir.path(), "exit 0");
        civicscan::HeadlessChromiumRenderer renderer(exe);
        REQUIRE_FALSE(renderer.render("https://tenant.example.com/", std::chrono::seconds(10)).ok);
    }
}
