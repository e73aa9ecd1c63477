#include "route_replay_source.hh"

#include <mutex>

RouteReplaySource::RouteReplaySource(std::unique_ptr<IRouteListener> route_listener,
                                     milliseconds interval,
                                     float speed)
    : m_route_listener(std::move(route_listener))
    , m_interval(interval)
    , m_speed(speed)
{
    m_route_listener->AwakeOn(GetSemaphore());
}

std::optional<milliseconds>
RouteReplaySource::OnActivation()
{
    while (auto ev = m_route_listener->Poll())
    {
        m_route = nullptr;
        m_next_index = 0;
        m_finished = false;

        if (ev->type == IRouteListener::EventType::kReady && ev->route && !ev->route->Empty())
        {
            m_route = ev->route;
        }
    }

    if (!m_route)
    {
        return std::nullopt;
    }

    auto points = m_route->Points();
    if (m_next_index >= points.size())
    {
        m_finished = true;
        return std::nullopt;
    }

    {
        std::lock_guard lock(m_mutex);
        m_position = points[m_next_index];
    }
    m_next_index++;
    m_has_data_semaphore.release();

    return m_interval;
}

std::optional<hal::RawFix>
RouteReplaySource::WaitForData(os::binary_semaphore& semaphore)
{
    // Bounded, so that the reader thread can be stopped
    auto has_data = m_has_data_semaphore.try_acquire_for(m_interval * 2);

    semaphore.release();
    if (!has_data)
    {
        return hal::RawFix {};
    }

    return CurrentFix().value_or(hal::RawFix {});
}

std::optional<hal::RawFix>
RouteReplaySource::LastKnownPosition()
{
    return CurrentFix();
}

std::optional<hal::RawFix>
RouteReplaySource::RequestSingleFix(milliseconds)
{
    return CurrentFix();
}

std::optional<hal::RawFix>
RouteReplaySource::CurrentFix()
{
    std::lock_guard lock(m_mutex);

    if (!m_position)
    {
        return std::nullopt;
    }

    return hal::RawFix {.position = m_position, .speed = m_speed, .timestamp = os::GetTimeStamp()};
}
