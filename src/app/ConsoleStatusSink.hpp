#pragma once

#include "updater/IRouteDbStatusSink.hpp"

#include <mutex>
#include <optional>

// Prints route database status changes to stdout and remembers the latest one
class ConsoleStatusSink : public updater::IRouteDbStatusSink
{
public:
    void updateRouteDbStatus(const updater::RouteDbStatus& status) override;

    std::optional<updater::RouteDbStatus> lastStatus() const;

private:
    mutable std::mutex mutex_;
    std::optional<updater::RouteDbStatus> last_status_;
};
