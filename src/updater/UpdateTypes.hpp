#pragma once

#include "utils/TimeUtils.hpp"

#include <string>
#include <variant>

namespace updater
{

// How well a route database matches the schema version required by the application.
// Both modes are usable.
enum class CompatibilityMode
{
    ExactMatch, // Same schema version
    BackwardCompatible // Newer minor version of the same major line
};

// A remotely offered route database that this application can use
struct UpdateCandidate
{
    std::string identifier; // Download locator, relative to the OTA base URL
    utils::Timestamp creationDate; // Newer date = more current database
    CompatibilityMode compatibilityMode = CompatibilityMode::ExactMatch;

    bool operator==(const UpdateCandidate&) const = default;
};

// One entry of the OTA metadata response, before filtering
struct RouteDbMetadata
{
    std::string downloadUrl;
    int schemaVersionMajor = 0;
    int schemaVersionMinor = 0;
    utils::Timestamp creationDate;
};

// Transport failure or non-success HTTP status
struct NetworkError
{
    std::string url;
    std::string message;
    int statusCode = 0; // 0 if no response was received
};

// The OTA service answered with data that is not the expected JSON
struct FormatError
{
    std::string message;
};

using FetchError = std::variant<NetworkError, FormatError>;

std::string describe(const FetchError& error);

const char* toString(CompatibilityMode mode);

} // namespace updater
