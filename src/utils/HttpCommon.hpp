#pragma once

#include <string>
#include <vector>

namespace utils
{

struct Header
{
    std::string name;
    std::string value;
};

struct SessionConfig
{
    int connect_timeout_ms = 5000;
    int timeout_ms = 60000;
    std::string user_agent = "trad-routedb";
};

struct HttpResponse
{
    int status_code = 0;
    std::string text;
    std::string error; // non-empty on network/transport errors

    bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }
};

// Minimal HTTP access needed by the updater; replaced by a fake in tests
class IHttpClient
{
public:
    virtual ~IHttpClient() = default;

    // GET the resource and return its body as text
    virtual HttpResponse get(const std::string& url, const std::vector<Header>& headers = {}) = 0;

    // GET the resource and write the body verbatim to destPath (text stays empty)
    virtual HttpResponse download(const std::string& url, const std::string& destPath) = 0;
};

// cpr based implementation
class HttpClient : public IHttpClient
{
public:
    explicit HttpClient(SessionConfig cfg = SessionConfig());

    HttpResponse get(const std::string& url, const std::vector<Header>& headers = {}) override;
    HttpResponse download(const std::string& url, const std::string& destPath) override;

private:
    SessionConfig cfg_;
};

} // namespace utils
