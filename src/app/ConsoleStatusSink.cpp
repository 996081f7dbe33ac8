#include "ConsoleStatusSink.hpp"

#include <iostream>

void ConsoleStatusSink::updateRouteDbStatus(const updater::RouteDbStatus& status)
{
    std::lock_guard<std::mutex> lock(mutex_);
    last_status_ = status;
    std::cout << (status.activated ? "[active] " : "[inactive] ") << status.message << std::endl;
}

std::optional<updater::RouteDbStatus> ConsoleStatusSink::lastStatus() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return last_status_;
}
