#pragma once

#include <functional>
#include <memory>
#include <string>

namespace usecases
{

class RouteDbUseCases;

enum class ServiceState
{
    Idle,
    Updating,
    Importing
};

// Callback types; invoked on the worker thread. Calling wait() from a callback returns at once,
// destroying the service from a callback is not allowed.
using UpdateFinishedCallback = std::function<void(bool installAttempted)>;
using ImportFinishedCallback = std::function<void(bool activated)>;

// Runs the route database use cases on a background thread, one at a time
class RouteDbUpdateService
{
public:
    explicit RouteDbUpdateService(RouteDbUseCases& useCases);
    ~RouteDbUpdateService();

    // Disable copy
    RouteDbUpdateService(const RouteDbUpdateService&) = delete;
    RouteDbUpdateService& operator=(const RouteDbUpdateService&) = delete;

    // Returns false (and never calls back) if another request is still running or the worker
    // thread cannot be started
    bool updateRouteDatabaseAsync(UpdateFinishedCallback callback = nullptr);
    bool importRouteDbFileAsync(const std::string& path, ImportFinishedCallback callback = nullptr);

    // Block until the running request (if any) has finished
    void wait();

    // Thread-safe
    ServiceState state() const;
    bool isBusy() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

const char* toString(ServiceState state);

} // namespace usecases
