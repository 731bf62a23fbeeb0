#include "PageListingReader.hpp"
#include "../../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <cctype>
#include <charconv>
#include <optional>
#include <string_view>
#include <unordered_set>

namespace civicscan
{

PageListingReader::PageListingReader(IPageRenderer* renderer, std::chrono::milliseconds timeout)
    : renderer_(renderer)
    , timeout_(timeout)
{
}

namespace
{

bool isSpace(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

char lower(char c)
{
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool startsWithNoCase(const std::string& text, std::size_t pos, std::string_view prefix)
{
    if (text.size() - pos < prefix.size())
        return false;
    for (std::size_t i = 0; i < prefix.size(); ++i)
    {
        if (lower(text[pos + i]) != prefix[i])
            return false;
    }
    return true;
}

// Returns the ID of the first "/videos/<digits>" segment in an href value
std::optional<VideoId> videoIdFromHref(std::string_view href)
{
    static constexpr std::string_view kMarker = "/videos/";

    for (auto pos = href.find(kMarker); pos != std::string_view::npos; pos = href.find(kMarker, pos + 1))
    {
        const auto digits_begin = pos + kMarker.size();
        auto digits_end = digits_begin;
        while (digits_end < href.size() && std::isdigit(static_cast<unsigned char>(href[digits_end])))
            ++digits_end;

        const auto length = digits_end - digits_begin;
        if (length == 0 || length > 18)
            continue;

        VideoId id = 0;
        auto [ptr, ec] = std::from_chars(href.data() + digits_begin, href.data() + digits_end, id);
        if (ec == std::errc())
            return id;
    }
    return std::nullopt;
}

// Walks the attributes of a tag starting at `pos` (just past the tag name) and returns the
// href value, leaving `pos` past the closing '>'. Quoted values may contain '>'.
std::optional<std::string_view> readHrefAttribute(const std::string& html, std::size_t& pos)
{
    std::optional<std::string_view> href;
    const std::size_t n = html.size();

    while (pos < n)
    {
        while (pos < n && (isSpace(html[pos]) || html[pos] == '/'))
            ++pos;
        if (pos >= n)
            break;
        if (html[pos] == '>')
        {
            ++pos;
            break;
        }

        const std::size_t name_begin = pos;
        while (pos < n && !isSpace(html[pos]) && html[pos] != '=' && html[pos] != '>')
            ++pos;
        const std::size_t name_end = pos;

        while (pos < n && isSpace(html[pos]))
            ++pos;
        if (pos >= n || html[pos] != '=')
            continue;
        ++pos;
        while (pos < n && isSpace(html[pos]))
            ++pos;

        std::size_t value_begin = pos;
        std::size_t value_end = pos;
        if (pos < n && (html[pos] == '"' || html[pos] == '\''))
        {
            const char quote = html[pos];
            value_begin = pos + 1;
            value_end = html.find(quote, value_begin);
            if (value_end == std::string::npos)
            {
                pos = n;
                break;
            }
            pos = value_end + 1;
        }
        else
        {
            while (pos < n && !isSpace(html[pos]) && html[pos] != '>')
                ++pos;
            value_end = pos;
        }

        if (!href && name_end - name_begin == 4 && startsWithNoCase(html, name_begin, "href"))
            href = std::string_view(html).substr(value_begin, value_end - value_begin);
    }
    return href;
}

} // namespace

std::vector<VideoId> PageListingReader::extractVideoIds(const std::string& html)
{
    std::vector<VideoId> ids;
    std::unordered_set<VideoId> seen;

    std::size_t pos = 0;
    while ((pos = html.find('<', pos)) != std::string::npos)
    {
        ++pos;
        if (pos + 1 > html.size() || lower(html[pos]) != 'a')
            continue;
        if (pos + 1 < html.size() && !isSpace(html[pos + 1]) && html[pos + 1] != '>')
            continue;

        ++pos;
        auto href = readHrefAttribute(html, pos);
        if (!href)
            continue;

        if (auto id = videoIdFromHref(*href); id && seen.insert(*id).second)
            ids.push_back(*id);
    }
    return ids;
}

ListingResult PageListingReader::listCandidates(const std::string& listingUrl)
{
    ListingResult result;

    if (listingUrl.empty())
    {
        result.error = "no listing URL configured";
        return result;
    }
    if (!renderer_)
    {
        result.error = "no page renderer available";
        return result;
    }

    auto rendered = renderer_->render(listingUrl, timeout_);
    if (!rendered.ok)
    {
        result.error = rendered.error.empty() ? "rendering failed" : rendered.error;
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Listing, "Listing page unavailable, scanning only",
                                            result.error);
        return result;
    }

    result.ids = extractVideoIds(rendered.html);
    if (result.ids.empty())
        PLOG_INFO << "No video links found on " << listingUrl;
    else
        PLOG_INFO << "Found " << result.ids.size() << " video link(s) on " << listingUrl;
    return result;
}

} // namespace civicscan
