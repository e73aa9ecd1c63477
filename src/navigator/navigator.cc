#include "navigator.hh"

#include <fmt/format.h>

Navigator::Navigator(NavigationState& state,
                     IPositionFeed& position_feed,
                     std::unique_ptr<IRouteListener> route_listener,
                     const NavigationConfig& config)
    : m_position_feed(position_feed)
    , m_route_listener(std::move(route_listener))
    , m_session(state, config)
{
    m_route_listener->AwakeOn(GetSemaphore());
}

void
Navigator::StartNavigation()
{
    PushCommand(Command::kStart);
}

void
Navigator::StopNavigation()
{
    PushCommand(Command::kStop);
}

void
Navigator::SetPositionLogging(bool enabled)
{
    PushCommand(enabled ? Command::kEnableLogging : Command::kDisableLogging);
}

void
Navigator::PushCommand(Command command)
{
    if (!m_commands.push(command))
    {
        fmt::print(stderr, "Navigator: command queue full, dropping command\n");
        return;
    }

    Awake();
}

std::optional<milliseconds>
Navigator::OnActivation()
{
    while (auto ev = m_route_listener->Poll())
    {
        HandleRouteEvent(*ev);
    }

    Command command;
    while (m_commands.pop(command))
    {
        HandleCommand(command);
    }

    HandlePositions();

    return std::nullopt;
}

void
Navigator::HandleRouteEvent(const IRouteListener::Event& event)
{
    switch (event.type)
    {
    case IRouteListener::EventType::kCalculating:
        break;

    case IRouteListener::EventType::kReady:
        // A new destination replaces the route wholesale
        Stop();
        m_route = event.route;
        break;

    case IRouteListener::EventType::kReleased:
        Stop();
        m_route = nullptr;
        break;

    case IRouteListener::EventType::kValueCount:
        break;
    }
}

void
Navigator::HandleCommand(Command command)
{
    switch (command)
    {
    case Command::kStart:
        Start();
        break;
    case Command::kStop:
        Stop();
        break;
    case Command::kEnableLogging:
        m_session.SetPositionLogging(true);
        break;
    case Command::kDisableLogging:
        m_session.SetPositionLogging(false);
        break;
    case Command::kValueCount:
        break;
    }
}

void
Navigator::HandlePositions()
{
    if (!m_position_port)
    {
        return;
    }

    while (auto ev = m_position_port->Poll())
    {
        switch (ev->type)
        {
        case IPositionPort::EventType::kFix:
            m_session.OnPositionUpdate(ev->fix);
            break;
        case IPositionPort::EventType::kUnavailable:
            m_session.OnPositionUnavailable();
            break;
        case IPositionPort::EventType::kValueCount:
            break;
        }
    }
}

void
Navigator::Start()
{
    auto result = m_session.Start(m_route);

    if (result != NavigationSession::Result::kOk)
    {
        fmt::print(stderr, "Navigator: cannot start navigation: {}\n", ToString(result));
        return;
    }

    if (!m_position_port)
    {
        m_position_port = m_position_feed.AttachListener();
        m_position_port->AwakeOn(GetSemaphore());
    }
}

void
Navigator::Stop()
{
    // Unsubscribe first, no stale position can reach the session after this
    m_position_port = nullptr;

    if (m_session.IsActive())
    {
        m_session.Stop();
    }
}
