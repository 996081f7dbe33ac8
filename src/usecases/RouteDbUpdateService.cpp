#include "RouteDbUpdateService.hpp"
#include "RouteDbUseCases.hpp"
#include "utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <atomic>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>

namespace usecases
{

struct RouteDbUpdateService::Impl
{
    RouteDbUseCases& useCases;

    // State (atomic for thread-safety)
    std::atomic<ServiceState> state{ ServiceState::Idle };

    // Guards starting and joining the worker
    std::mutex workerMutex;
    std::thread worker;

    explicit Impl(RouteDbUseCases& u)
        : useCases(u)
    {
    }

    ~Impl() { join(); }

    // Joined outside the lock, so a completion callback calling wait() cannot block on it
    void join()
    {
        std::thread finishing;
        {
            std::lock_guard<std::mutex> lock(workerMutex);
            if (!worker.joinable())
            {
                return;
            }
            // Called from a completion callback: the request is finishing on this very thread
            if (worker.get_id() == std::this_thread::get_id())
            {
                PLOG_DEBUG << "wait() called on the route database worker thread, ignored";
                return;
            }
            finishing = std::move(worker);
        }
        finishing.join();
    }

    // Claims the service for a new request. Only one caller wins while a request is running.
    bool tryBegin(ServiceState next)
    {
        ServiceState expected = ServiceState::Idle;
        if (!state.compare_exchange_strong(expected, next))
        {
            PLOG_WARNING << "Route database " << toString(expected) << " already in progress, request rejected";
            return false;
        }
        return true;
    }

    // Starts the claimed request. On failure the claim is released again.
    template <typename Work>
    bool launch(Work work)
    {
        std::lock_guard<std::mutex> lock(workerMutex);
        // The previous worker has already left the busy state
        if (worker.joinable())
        {
            worker.join();
        }
        try
        {
            worker = std::thread(
                [this, work = std::move(work)]()
                {
                    try
                    {
                        work();
                    }
                    catch (const std::exception& e)
                    {
                        utils::ErrorReporter::ReportError(utils::ErrorCategory::RouteDb,
                                                          "Route database operation failed", e.what());
                    }
                    state = ServiceState::Idle;
                });
        }
        catch (const std::system_error& e)
        {
            state = ServiceState::Idle;
            utils::ErrorReporter::ReportError(utils::ErrorCategory::RouteDb,
                                              "Could not start the route database worker", e.what());
            return false;
        }
        return true;
    }
};

RouteDbUpdateService::RouteDbUpdateService(RouteDbUseCases& useCases)
    : impl_(std::make_unique<Impl>(useCases))
{
}

RouteDbUpdateService::~RouteDbUpdateService() = default;

bool RouteDbUpdateService::updateRouteDatabaseAsync(UpdateFinishedCallback callback)
{
    if (!impl_->tryBegin(ServiceState::Updating))
    {
        return false;
    }

    return impl_->launch(
        [impl = impl_.get(), callback = std::move(callback)]()
        {
            const bool attempted = impl->useCases.updateRouteDatabase();
            if (callback)
            {
                callback(attempted);
            }
        });
}

bool RouteDbUpdateService::importRouteDbFileAsync(const std::string& path, ImportFinishedCallback callback)
{
    if (!impl_->tryBegin(ServiceState::Importing))
    {
        return false;
    }

    return impl_->launch(
        [impl = impl_.get(), path, callback = std::move(callback)]()
        {
            const bool activated = impl->useCases.importRouteDbFile(path);
            if (callback)
            {
                callback(activated);
            }
        });
}

void RouteDbUpdateService::wait() { impl_->join(); }

ServiceState RouteDbUpdateService::state() const { return impl_->state.load(); }

bool RouteDbUpdateService::isBusy() const { return impl_->state.load() != ServiceState::Idle; }

const char* toString(ServiceState state)
{
    switch (state)
    {
    case ServiceState::Idle:
        return "idle";
    case ServiceState::Updating:
        return "update";
    case ServiceState::Importing:
        return "import";
    }
    return "unknown";
}

} // namespace usecases
