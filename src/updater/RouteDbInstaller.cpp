#include "RouteDbInstaller.hpp"
#include "CandidateSelector.hpp"
#include "IRouteDbUpdateSource.hpp"
#include "routedb/IRouteDbStorage.hpp"
#include "utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <exception>
#include <type_traits>

namespace updater
{

namespace
{

// Calls cleanup() on the update source when leaving updateFromRemote()
struct CleanupGuard
{
    IRouteDbUpdateSource& source;

    explicit CleanupGuard(IRouteDbUpdateSource& s)
        : source(s)
    {
    }

    ~CleanupGuard() { source.cleanup(); }
};

RouteDbStatus unavailableStatus(const std::string& message)
{
    RouteDbStatus status;
    status.activated = false;
    status.message = message;
    return status;
}

} // namespace

RouteDbInstaller::RouteDbInstaller(routedb::IRouteDbStorage& storage, IRouteDbUpdateSource& updateSource,
                                   IRouteDbStatusSink& statusSink)
    : storage_(storage)
    , updateSource_(updateSource)
    , statusSink_(statusSink)
{
}

RouteDbStatus RouteDbInstaller::statusForError(const routedb::StorageStartingError& error)
{
    return std::visit(
        [](const auto& e) -> RouteDbStatus
        {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, routedb::InaccessibleStorageError>)
            {
                return unavailableStatus("No route data available - please import a database file");
            }
            else if constexpr (std::is_same_v<T, routedb::InvalidStorageFormatError>)
            {
                return unavailableStatus("The route database file is damaged or not a route database");
            }
            else
            {
                static_assert(std::is_same_v<T, routedb::IncompatibleStorageError>);
                return unavailableStatus("The route database requires a different app version (found " +
                                         e.foundVersion.toString() + ", need " + e.requiredVersion.toString() +
                                         ")");
            }
        },
        error);
}

RouteDbStatus RouteDbInstaller::statusForActive(utils::Timestamp creationDate)
{
    RouteDbStatus status;
    status.activated = true;
    status.creationDate = creationDate;
    status.label = utils::formatDate(creationDate);
    status.message = "Route database from " + status.label;
    return status;
}

bool RouteDbInstaller::activateInstalledDatabase()
{
    RouteDbStatus status;
    try
    {
        routedb::StorageStartingError error;
        if (storage_.start(error))
        {
            status = statusForActive(storage_.creationDate());
        }
        else
        {
            status = statusForError(error);
        }
    }
    catch (const std::exception& e)
    {
        PLOG_ERROR << "Unexpected failure while starting the route database: " << e.what();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::RouteDb, "Route database could not be started",
                                          e.what());
        status = unavailableStatus("No route data available - please import a database file");
    }

    PLOG_INFO << "Route database status: " << status.message;
    statusSink_.updateRouteDbStatus(status);
    return status.activated;
}

bool RouteDbInstaller::installFromLocalFile(const std::string& path)
{
    PLOG_INFO << "Installing route database from " << path;
    try
    {
        if (storage_.isConnected())
        {
            storage_.stop();
        }

        routedb::ImportError importError;
        if (!storage_.importFile(path, importError))
        {
            // The previous file may still be usable, start anyway
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::RouteDb,
                                                "The route database file could not be imported",
                                                routedb::describe(importError));
        }
    }
    catch (const std::exception& e)
    {
        PLOG_ERROR << "Route database import aborted: " << e.what();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::RouteDb,
                                          "The route database file could not be imported", e.what());
    }

    return activateInstalledDatabase();
}

bool RouteDbInstaller::updateFromRemote()
{
    std::vector<UpdateCandidate> candidates;
    try
    {
        FetchError fetchError;
        if (!updateSource_.listCandidates(candidates, fetchError))
        {
            PLOG_INFO << "No route database update available: " << describe(fetchError);
            return false;
        }
    }
    catch (const std::exception& e)
    {
        PLOG_ERROR << "Route database update check failed: " << e.what();
        return false;
    }

    CleanupGuard cleanupGuard(updateSource_);
    try
    {
        std::optional<utils::Timestamp> installedDate;
        if (storage_.isConnected())
        {
            installedDate = storage_.creationDate();
        }

        auto candidate = selectBestCandidate(installedDate, candidates);
        if (!candidate)
        {
            PLOG_INFO << "Route database is up to date (" << candidates.size() << " candidate(s) checked)";
            return false;
        }

        PLOG_INFO << "Route database update found: " << candidate->identifier << " from "
                  << utils::formatIso8601(candidate->creationDate) << " (" << toString(candidate->compatibilityMode)
                  << ")";

        std::string localPath;
        FetchError fetchError;
        if (!updateSource_.materialize(*candidate, localPath, fetchError))
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Network,
                                                "The route database update could not be downloaded",
                                                describe(fetchError));
            return false;
        }

        installFromLocalFile(localPath);
        return true;
    }
    catch (const std::exception& e)
    {
        PLOG_ERROR << "Route database update failed: " << e.what();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::RouteDb, "The route database update failed",
                                          e.what());
        return false;
    }
}

} // namespace updater
