#pragma once

#include "utils/TimeUtils.hpp"

#include <optional>
#include <string>

namespace updater
{

// What the user gets to see about the route database after a start or install attempt
struct RouteDbStatus
{
    bool activated = false;
    std::optional<utils::Timestamp> creationDate; // Set when activated
    std::string label; // Short identifying label, e.g. the creation date
    std::string message; // Full sentence for the status line
};

// Presentation boundary
class IRouteDbStatusSink
{
public:
    virtual ~IRouteDbStatusSink() = default;

    virtual void updateRouteDbStatus(const RouteDbStatus& status) = 0;
};

} // namespace updater
