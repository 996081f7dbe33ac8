#include "HttpCommon.hpp"

#include <cpr/cpr.h>
#include <plog/Log.h>

#include <filesystem>
#include <fstream>
#include <system_error>

namespace
{

inline void apply_common(cpr::Session& s, const utils::SessionConfig& cfg)
{
    s.SetConnectTimeout(cpr::ConnectTimeout{ cfg.connect_timeout_ms });
    s.SetTimeout(cpr::Timeout{ cfg.timeout_ms });
    s.SetUserAgent(cpr::UserAgent{ cfg.user_agent });
}

inline cpr::Header make_header(const std::vector<utils::Header>& headers)
{
    cpr::Header h;
    for (auto& kv : headers)
    {
        h.emplace(kv.name, kv.value);
    }
    return h;
}

} // namespace

namespace utils
{

HttpClient::HttpClient(SessionConfig cfg)
    : cfg_(std::move(cfg))
{
}

HttpResponse HttpClient::get(const std::string& url, const std::vector<Header>& headers)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header(headers));
    apply_common(s, cfg_);
    auto r = s.Get();
    HttpResponse hr;
    if (r.error)
    {
        hr.error = r.error.message;
        return hr;
    }
    hr.status_code = static_cast<int>(r.status_code);
    hr.text = std::move(r.text);
    return hr;
}

HttpResponse HttpClient::download(const std::string& url, const std::string& destPath)
{
    HttpResponse hr;

    std::ofstream outputFile(destPath, std::ios::binary | std::ios::trunc);
    if (!outputFile.is_open())
    {
        hr.error = "Failed to create output file: " + destPath;
        PLOG_ERROR << hr.error;
        return hr;
    }

    PLOG_INFO << "Starting download: " << url;

    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    apply_common(s, cfg_);
    cpr::Response r = s.Download(outputFile);
    outputFile.close();

    if (r.error)
    {
        hr.error = r.error.message;
    }
    else if (outputFile.fail())
    {
        hr.error = "Failed to write " + destPath;
    }
    hr.status_code = static_cast<int>(r.status_code);

    if (!hr.ok())
    {
        // Never leave a partial download behind
        std::error_code ec;
        std::filesystem::remove(destPath, ec);
        if (ec)
        {
            PLOG_WARNING << "Failed to remove partial download " << destPath << ": " << ec.message();
        }
        return hr;
    }

    PLOG_INFO << "Download completed: " << destPath;
    return hr;
}

} // namespace utils
