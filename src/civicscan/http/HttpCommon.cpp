#include "HttpCommon.hpp"

#include <cpr/cpr.h>

#include <cctype>
#include <utility>

namespace
{

inline void apply_common(cpr::Session& s, const civicscan::http::SessionConfig& cfg)
{
    s.SetConnectTimeout(cpr::ConnectTimeout{ cfg.connect_timeout_ms });
    s.SetTimeout(cpr::Timeout{ cfg.timeout_ms });
    s.SetRedirect(cpr::Redirect{ cfg.follow_redirects });
}

inline bool iequals(const std::string& a, const char* b)
{
    std::size_t i = 0;
    for (; i < a.size() && b[i] != '\0'; ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return i == a.size() && b[i] == '\0';
}

inline cpr::Header make_header(const std::vector<civicscan::http::Header>& headers, const std::string& user_agent,
                               bool ensure_json)
{
    cpr::Header h;
    bool has_ct = false;
    bool has_ua = false;
    for (const auto& kv : headers)
    {
        if (iequals(kv.name, "Content-Type"))
            has_ct = true;
        if (iequals(kv.name, "User-Agent"))
            has_ua = true;
        h.emplace(kv.name, kv.value);
    }
    if (ensure_json && !has_ct)
        h.emplace("Content-Type", "application/json");
    if (!has_ua && !user_agent.empty())
        h.emplace("User-Agent", user_agent);
    return h;
}

civicscan::http::HttpResponse to_response(cpr::Response&& r)
{
    civicscan::http::HttpResponse hr;
    if (r.error)
    {
        hr.error = r.error.message.empty() ? "transport error" : r.error.message;
        hr.timed_out = r.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT;
        return hr;
    }
    hr.status_code = static_cast<int>(r.status_code);
    auto loc = r.header.find("Location");
    if (loc != r.header.end())
        hr.location = loc->second;
    hr.text = std::move(r.text);
    return hr;
}

} // namespace

namespace civicscan::http
{

CprHttpClient::CprHttpClient(std::string user_agent)
    : user_agent_(std::move(user_agent))
{
}

HttpResponse CprHttpClient::head(const std::string& url, const SessionConfig& cfg)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header({}, user_agent_, false));
    apply_common(s, cfg);
    return to_response(s.Head());
}

HttpResponse CprHttpClient::get(const std::string& url, const std::vector<Header>& headers, const SessionConfig& cfg)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header(headers, user_agent_, false));
    apply_common(s, cfg);
    return to_response(s.Get());
}

HttpResponse CprHttpClient::putJson(const std::string& url, const std::string& body,
                                    const std::vector<Header>& headers, const SessionConfig& cfg)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header(headers, user_agent_, true));
    s.SetBody(cpr::Body{ body });
    apply_common(s, cfg);
    return to_response(s.Put());
}

std::string urlEscape(const std::string& s)
{
    std::string out;
    out.reserve(s.size() * 3);
    const char* hex = "0123456789ABCDEF";
    for (unsigned char c : s)
    {
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_' ||
            c == '.' || c == '~')
        {
            out.push_back(static_cast<char>(c));
        }
        else
        {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

} // namespace civicscan::http
