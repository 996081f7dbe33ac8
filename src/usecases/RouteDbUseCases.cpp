#include "RouteDbUseCases.hpp"
#include "updater/RouteDbInstaller.hpp"

#include <plog/Log.h>

namespace usecases
{

RouteDbUseCases::RouteDbUseCases(updater::RouteDbInstaller& installer)
    : installer_(installer)
{
}

bool RouteDbUseCases::startRouteDb()
{
    const bool active = installer_.activateInstalledDatabase();
    if (!active)
    {
        PLOG_WARNING << "Starting without route data";
    }
    return active;
}

bool RouteDbUseCases::updateRouteDatabase()
{
    PLOG_INFO << "Route database update requested";
    return installer_.updateFromRemote();
}

bool RouteDbUseCases::importRouteDbFile(const std::string& path)
{
    PLOG_INFO << "Route database import requested: " << path;
    return installer_.installFromLocalFile(path);
}

} // namespace usecases
