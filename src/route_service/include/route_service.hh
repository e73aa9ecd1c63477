#pragma once

#include "i_route_listener.hh"
#include "route_plan.hh"

#include <etl/mutex.h>
#include <etl/vector.h>
#include <string_view>

/**
 * @brief Entry point for the routing collaborator's results
 *
 * The route itself is computed elsewhere, the service hands the result to
 * every attached listener.
 */
class RouteService
{
public:
    constexpr static auto kMaxListeners = 4;

    std::unique_ptr<IRouteListener> AttachListener();

    // Context: Any thread
    void MarkCalculating();

    void Publish(RoutePlan route);

    // Decode and publish an OSRM response. A broken response publishes an empty route
    void PublishOsrmResponse(std::string_view response);

    // The destination was cleared
    void Release();

private:
    class RouteListenerImpl;

    void PushEvent(const IRouteListener::Event& event);
    void Detach(const RouteListenerImpl* listener);

    etl::mutex m_mutex;
    etl::vector<RouteListenerImpl*, kMaxListeners> m_listeners;
};
