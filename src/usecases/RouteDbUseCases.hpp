#pragma once

#include <string>

namespace updater
{
class RouteDbInstaller;
}

namespace usecases
{

// Entry points for the front ends. All of them report the outcome through the status sink.
class RouteDbUseCases
{
public:
    explicit RouteDbUseCases(updater::RouteDbInstaller& installer);

    // Open the installed route database on application start.
    // Returns false if there is none, the user should be sent to the import settings then.
    bool startRouteDb();

    // Check the OTA service and install a newer route database if there is one.
    // Returns true if an install was attempted.
    bool updateRouteDatabase();

    // Replace the route database with a file chosen by the user. Returns whether it is active afterwards.
    bool importRouteDbFile(const std::string& path);

private:
    updater::RouteDbInstaller& installer_;
};

} // namespace usecases
