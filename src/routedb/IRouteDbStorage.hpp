#pragma once

#include "RouteDbTypes.hpp"
#include "StorageErrors.hpp"
#include "utils/TimeUtils.hpp"

#include <optional>
#include <string>
#include <vector>

namespace routedb
{

/**
 * @brief Read-only route database storage.
 *
 * The storage is either disconnected (initial state) or connected. start() and stop() switch
 * between the two. importFile() requires a disconnected storage, creationDate() and all
 * retrieve*() methods require a connected one. Calling them in the wrong state is a programming
 * error and throws std::logic_error.
 */
class IRouteDbStorage
{
public:
    virtual ~IRouteDbStorage() = default;

    /**
     * @brief Open the route database and verify its schema version.
     * @return true on success; false with outError set, the storage stays disconnected
     */
    virtual bool start(StorageStartingError& outError) = 0;

    // Close the database if open. Never fails.
    virtual void stop() = 0;

    virtual bool isConnected() const = 0;

    /**
     * @brief Replace the route database file with a copy of sourcePath.
     *
     * Either the database file becomes an exact copy of the source or it stays untouched. The
     * schema is not checked here, the next start() does that.
     */
    virtual bool importFile(const std::string& sourcePath, ImportError& outError) = 0;

    // Creation time of the connected database
    virtual utils::Timestamp creationDate() const = 0;

    virtual std::vector<Summit> retrieveSummits(const std::optional<std::string>& nameFilter = std::nullopt) = 0;
    virtual Summit retrieveSummit(std::int64_t summitId) = 0;
    virtual std::vector<Route> retrieveRoutesOfSummit(std::int64_t summitId, RoutesSortMode sortMode) = 0;
    virtual Route retrieveRoute(std::int64_t routeId) = 0;
    virtual std::vector<Post> retrievePostsOfRoute(std::int64_t routeId, PostsSortMode sortMode) = 0;
};

} // namespace routedb
