#pragma once

#include <string>
#include <vector>

namespace civicscan::http
{

struct Header
{
    std::string name;
    std::string value;
};

struct SessionConfig
{
    int connect_timeout_ms = 3000;
    int timeout_ms = 5000;
    bool follow_redirects = true;
};

struct HttpResponse
{
    int status_code = 0;
    std::string text;
    std::string location; // Location header, filled when redirects are not followed
    std::string error; // non-empty on network/transport errors
    bool timed_out = false;

    bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }
    bool transportFailed() const { return !error.empty(); }
    bool isRedirect() const { return error.empty() && status_code >= 300 && status_code < 400; }
};

/**
 * @brief Minimal HTTP surface used by the prober and the scan-state store
 *
 * Implementations must be safe to call from several threads at once and must
 * report transport failures through HttpResponse::error instead of throwing.
 */
class IHttpClient
{
public:
    virtual ~IHttpClient() = default;

    virtual HttpResponse head(const std::string& url, const SessionConfig& cfg) = 0;

    virtual HttpResponse get(const std::string& url, const std::vector<Header>& headers,
                             const SessionConfig& cfg) = 0;

    virtual HttpResponse putJson(const std::string& url, const std::string& body,
                                 const std::vector<Header>& headers, const SessionConfig& cfg) = 0;
};

// cpr-backed client; one cpr::Session per request
class CprHttpClient : public IHttpClient
{
public:
    explicit CprHttpClient(std::string user_agent = "civicscan");

    HttpResponse head(const std::string& url, const SessionConfig& cfg) override;
    HttpResponse get(const std::string& url, const std::vector<Header>& headers, const SessionConfig& cfg) override;
    HttpResponse putJson(const std::string& url, const std::string& body, const std::vector<Header>& headers,
                         const SessionConfig& cfg) override;

private:
    std::string user_agent_;
};

// Percent-encode a query component
std::string urlEscape(const std::string& s);

} // namespace civicscan::http
