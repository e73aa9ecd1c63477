#pragma once

#include "base_thread.hh"
#include "i_route_listener.hh"
#include "navigation_config.hh"
#include "navigation_session.hh"
#include "navigation_state.hh"
#include "position_port.hh"

#include <etl/queue_spsc_atomic.h>

/**
 * @brief Serializes route events, user commands and position events into the session
 *
 * The session is only touched from this thread.
 */
class Navigator : public os::BaseThread
{
public:
    Navigator(NavigationState& state,
              IPositionFeed& position_feed,
              std::unique_ptr<IRouteListener> route_listener,
              const NavigationConfig& config);

    // Context: Another thread
    void StartNavigation();

    // Context: Another thread. The position subscription is dropped before the session stops
    void StopNavigation();

    // Context: Another thread
    void SetPositionLogging(bool enabled);

private:
    enum class Command : uint8_t
    {
        kStart,
        kStop,
        kEnableLogging,
        kDisableLogging,

        kValueCount,
    };

    std::optional<milliseconds> OnActivation() final;

    void PushCommand(Command command);

    void HandleRouteEvent(const IRouteListener::Event& event);
    void HandleCommand(Command command);
    void HandlePositions();

    void Start();
    void Stop();

    IPositionFeed& m_position_feed;
    std::unique_ptr<IRouteListener> m_route_listener;

    NavigationSession m_session;
    std::shared_ptr<const RoutePlan> m_route;
    std::unique_ptr<IPositionPort> m_position_port;

    etl::queue_spsc_atomic<Command, 8> m_commands;
};
