#include "RouteDbUpdateSource.hpp"
#include "utils/HttpCommon.hpp"
#include "utils/TempDirectory.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <cstdint>
#include <limits>
#include <system_error>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace updater
{

namespace
{

// File name of a downloaded database inside its temporary directory
constexpr const char* kDownloadFileName = "routedb.sqlite";

bool readString(const json& entry, const char* key, std::string& outValue, FormatError& outError)
{
    auto it = entry.find(key);
    if (it == entry.end() || !it->is_string())
    {
        outError.message = std::string("Expected string '") + key + "' is missing in JSON data";
        return false;
    }
    outValue = it->get<std::string>();
    return true;
}

bool readInt(const json& entry, const char* key, int& outValue, FormatError& outError)
{
    auto it = entry.find(key);
    if (it == entry.end() || !it->is_number_integer())
    {
        outError.message = std::string("Expected integer '") + key + "' is missing in JSON data";
        return false;
    }
    // Read wide first, get<int>() would truncate silently
    const bool inRange = it->is_number_unsigned()
                             ? it->get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                             : it->get<std::int64_t>() >= std::numeric_limits<int>::min() &&
                                   it->get<std::int64_t>() <= std::numeric_limits<int>::max();
    if (!inRange)
    {
        outError.message = std::string("Integer '") + key + "' is out of range: " + it->dump();
        return false;
    }
    outValue = static_cast<int>(it->get<std::int64_t>());
    return true;
}

} // namespace

struct RouteDbUpdateSource::Impl
{
    utils::IHttpClient& http;
    OtaSettings settings;
    routedb::Version supportedVersion;

    // Directories created by materialize(), deleted by cleanup()
    std::vector<fs::path> directoriesToDelete;

    Impl(utils::IHttpClient& h, OtaSettings s, routedb::Version v)
        : http(h)
        , settings(std::move(s))
        , supportedVersion(v)
    {
    }

    ~Impl()
    {
        if (!directoriesToDelete.empty())
        {
            PLOG_WARNING << directoriesToDelete.size() << " temporary OTA director(y/ies) left behind";
        }
    }

    bool isCompatible(const RouteDbMetadata& entry) const
    {
        return entry.schemaVersionMajor == supportedVersion.major() &&
               entry.schemaVersionMinor >= supportedVersion.minor();
    }

    UpdateCandidate createCandidate(const RouteDbMetadata& entry) const
    {
        UpdateCandidate candidate;
        candidate.identifier = entry.downloadUrl;
        candidate.creationDate = entry.creationDate;
        candidate.compatibilityMode = entry.schemaVersionMinor == supportedVersion.minor()
                                          ? CompatibilityMode::ExactMatch
                                          : CompatibilityMode::BackwardCompatible;
        return candidate;
    }

    fs::path tempRoot() const
    {
        return settings.tempRoot.empty() ? fs::temp_directory_path() : settings.tempRoot;
    }
};

RouteDbUpdateSource::RouteDbUpdateSource(utils::IHttpClient& http, OtaSettings settings,
                                         routedb::Version supportedVersion)
    : impl_(std::make_unique<Impl>(http, std::move(settings), supportedVersion))
{
}

RouteDbUpdateSource::~RouteDbUpdateSource() = default;

bool RouteDbUpdateSource::listCandidates(std::vector<UpdateCandidate>& outCandidates, FetchError& outError)
{
    const std::string url = resolveUrl(impl_->settings.baseUrl, impl_->settings.apiEndpoint);
    PLOG_INFO << "Checking for route database updates: " << url;

    utils::HttpResponse response = impl_->http.get(url, { { "Accept", "application/json" } });
    if (!response.ok())
    {
        outError = NetworkError{ url, response.error.empty() ? "unexpected HTTP status" : response.error,
                                 response.status_code };
        PLOG_WARNING << describe(outError);
        return false;
    }

    std::vector<RouteDbMetadata> entries;
    FormatError formatError;
    if (!parseMetadata(response.text, entries, formatError))
    {
        outError = formatError;
        PLOG_WARNING << describe(outError);
        return false;
    }

    outCandidates.clear();
    for (const auto& entry : entries)
    {
        if (!impl_->isCompatible(entry))
        {
            PLOG_DEBUG << "Ignoring route database " << entry.downloadUrl << " with schema "
                       << entry.schemaVersionMajor << "." << entry.schemaVersionMinor;
            continue;
        }
        outCandidates.push_back(impl_->createCandidate(entry));
    }

    PLOG_INFO << entries.size() << " route database(s) offered, " << outCandidates.size() << " usable";
    return true;
}

bool RouteDbUpdateSource::materialize(const UpdateCandidate& candidate, std::string& outPath, FetchError& outError)
{
    const std::string url = resolveUrl(impl_->settings.baseUrl, candidate.identifier);

    fs::path tempDir;
    try
    {
        tempDir = utils::createTempDirectory(impl_->tempRoot(), "trad-ota-");
    }
    catch (const std::system_error& e)
    {
        // also covers std::filesystem::filesystem_error
        outError = NetworkError{ url, std::string("cannot create download directory: ") + e.what(), 0 };
        PLOG_ERROR << describe(outError);
        return false;
    }
    impl_->directoriesToDelete.push_back(tempDir);

    const fs::path tempFile = tempDir / kDownloadFileName;
    utils::HttpResponse response = impl_->http.download(url, tempFile.string());
    if (!response.ok())
    {
        outError = NetworkError{ url, response.error.empty() ? "unexpected HTTP status" : response.error,
                                 response.status_code };
        PLOG_ERROR << "Route database download failed: " << describe(outError);
        return false;
    }

    outPath = tempFile.string();
    return true;
}

void RouteDbUpdateSource::cleanup()
{
    for (const auto& dir : impl_->directoriesToDelete)
    {
        std::error_code ec;
        fs::remove_all(dir, ec);
        if (ec)
        {
            PLOG_WARNING << "Failed to delete temporary directory " << dir.string() << ": " << ec.message();
        }
        else
        {
            PLOG_DEBUG << "Deleted temporary directory " << dir.string();
        }
    }
    impl_->directoriesToDelete.clear();
}

bool RouteDbUpdateSource::parseMetadata(const std::string& jsonText, std::vector<RouteDbMetadata>& outEntries,
                                        FormatError& outError)
{
    json document;
    try
    {
        document = json::parse(jsonText);
    }
    catch (const json::exception& e)
    {
        outError.message = std::string("JSON parse error: ") + e.what();
        return false;
    }

    if (!document.is_array())
    {
        outError.message = "Expected a JSON array of route databases";
        return false;
    }

    std::vector<RouteDbMetadata> entries;
    for (const auto& item : document)
    {
        if (!item.is_object())
        {
            outError.message = "Route database entry is not a JSON object";
            return false;
        }

        RouteDbMetadata entry;
        std::string creationDate;
        if (!readString(item, "downloadUrl", entry.downloadUrl, outError) ||
            !readInt(item, "schemaVersionMajor", entry.schemaVersionMajor, outError) ||
            !readInt(item, "schemaVersionMinor", entry.schemaVersionMinor, outError) ||
            !readString(item, "creationDate", creationDate, outError))
        {
            return false;
        }
        if (!utils::parseIso8601(creationDate, entry.creationDate))
        {
            outError.message = "Invalid creation timestamp: " + creationDate;
            return false;
        }
        entries.push_back(std::move(entry));
    }

    outEntries = std::move(entries);
    return true;
}

std::string RouteDbUpdateSource::resolveUrl(const std::string& baseUrl, const std::string& reference)
{
    if (reference.find("://") != std::string::npos)
    {
        return reference;
    }

    const auto schemeEnd = baseUrl.find("://");
    const auto authorityStart = schemeEnd == std::string::npos ? 0 : schemeEnd + 3;
    if (!reference.empty() && reference[0] == '/')
    {
        const auto pathStart = baseUrl.find('/', authorityStart);
        return (pathStart == std::string::npos ? baseUrl : baseUrl.substr(0, pathStart)) + reference;
    }

    const auto lastSlash = baseUrl.rfind('/');
    if (lastSlash == std::string::npos || lastSlash < authorityStart)
    {
        return baseUrl + "/" + reference;
    }
    return baseUrl.substr(0, lastSlash + 1) + reference;
}

} // namespace updater
