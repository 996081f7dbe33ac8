#pragma once

#include "IRouteDbUpdateSource.hpp"
#include "routedb/Version.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace utils
{
class IHttpClient;
}

namespace updater
{

struct OtaSettings
{
    std::string baseUrl = "https://www.fomori.de/trad/ota/";
    std::string apiEndpoint = "api.php"; // Relative to baseUrl
    std::filesystem::path tempRoot; // Empty: system temp directory
};

// Client of the trad OTA web service, which lists the available route databases as JSON
class RouteDbUpdateSource : public IRouteDbUpdateSource
{
public:
    RouteDbUpdateSource(utils::IHttpClient& http, OtaSettings settings, routedb::Version supportedVersion);
    ~RouteDbUpdateSource() override;

    RouteDbUpdateSource(const RouteDbUpdateSource&) = delete;
    RouteDbUpdateSource& operator=(const RouteDbUpdateSource&) = delete;

    bool listCandidates(std::vector<UpdateCandidate>& outCandidates, FetchError& outError) override;
    bool materialize(const UpdateCandidate& candidate, std::string& outPath, FetchError& outError) override;
    void cleanup() override;

    // Parse the OTA JSON document. Any malformed entry invalidates the whole document.
    static bool parseMetadata(const std::string& jsonText, std::vector<RouteDbMetadata>& outEntries,
                              FormatError& outError);

    // Resolve a (possibly relative) reference against a base URL
    static std::string resolveUrl(const std::string& baseUrl, const std::string& reference);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace updater
