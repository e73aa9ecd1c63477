#pragma once

#include "route_plan.hh"
#include "semaphore.hh"

#include <memory>
#include <optional>

class IRouteListener
{
public:
    enum class EventType
    {
        kCalculating, // New route being requested
        kReady,       // The route is ready (possibly empty, if the request failed)
        kReleased,    // The route is released (destination cleared)

        kValueCount,
    };

    struct Event
    {
        EventType type;

        // Valid if kReady
        std::shared_ptr<const RoutePlan> route;
    };


    virtual ~IRouteListener() = default;

    virtual void AwakeOn(os::binary_semaphore& semaphore) = 0;

    virtual std::optional<Event> Poll() = 0;
};
