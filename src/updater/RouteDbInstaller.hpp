#pragma once

#include "IRouteDbStatusSink.hpp"
#include "routedb/StorageErrors.hpp"

#include <string>

namespace routedb
{
class IRouteDbStorage;
}

namespace updater
{

class IRouteDbUpdateSource;

/**
 * @brief Replaces the route database and restarts the storage around it.
 *
 * Errors never leave this class: every outcome ends up as a RouteDbStatus sent to the sink.
 * A failed install leaves the previously installed database in place if there was one.
 */
class RouteDbInstaller
{
public:
    RouteDbInstaller(routedb::IRouteDbStorage& storage, IRouteDbUpdateSource& updateSource,
                     IRouteDbStatusSink& statusSink);

    // Start the storage with whatever database file is installed and report the result.
    // Returns whether the route database is active.
    bool activateInstalledDatabase();

    // Import a user chosen database file and restart the storage.
    // Returns whether the route database is active afterwards.
    bool installFromLocalFile(const std::string& path);

    // Download and install the best remote database, if one is newer than the installed one.
    // Returns true if an install was attempted.
    bool updateFromRemote();

    // Status shown for a storage that failed to start
    static RouteDbStatus statusForError(const routedb::StorageStartingError& error);

    // Status shown for a connected storage
    static RouteDbStatus statusForActive(utils::Timestamp creationDate);

private:
    routedb::IRouteDbStorage& storage_;
    IRouteDbUpdateSource& updateSource_;
    IRouteDbStatusSink& statusSink_;
};

} // namespace updater
