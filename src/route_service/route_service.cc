#include "route_service.hh"

#include <algorithm>
#include <cassert>
#include <etl/queue_spsc_atomic.h>
#include <fmt/format.h>
#include <mutex>

class RouteService::RouteListenerImpl : public IRouteListener
{
public:
    explicit RouteListenerImpl(RouteService& parent)
        : m_parent(parent)
    {
    }

    ~RouteListenerImpl() final
    {
        m_parent.Detach(this);
    }

    void PushEvent(const IRouteListener::Event& event)
    {
        if (!m_events.push(event))
        {
            fmt::print(stderr, "RouteService: listener queue full, dropping event\n");
            return;
        }

        if (m_semaphore)
        {
            m_semaphore->release();
        }
    }

private:
    void AwakeOn(os::binary_semaphore& semaphore) final
    {
        std::lock_guard lock(m_parent.m_mutex);

        m_semaphore = &semaphore;
    }

    std::optional<IRouteListener::Event> Poll() final
    {
        IRouteListener::Event ev;

        if (m_events.pop(ev))
        {
            return ev;
        }

        return std::nullopt;
    }

    RouteService& m_parent;
    os::binary_semaphore* m_semaphore {nullptr};
    etl::queue_spsc_atomic<IRouteListener::Event, 4> m_events;
};


std::unique_ptr<IRouteListener>
RouteService::AttachListener()
{
    std::lock_guard lock(m_mutex);

    assert(!m_listeners.full());

    auto out = std::make_unique<RouteService::RouteListenerImpl>(*this);
    m_listeners.push_back(out.get());

    return out;
}

void
RouteService::MarkCalculating()
{
    PushEvent({IRouteListener::EventType::kCalculating, nullptr});
}

void
RouteService::Publish(RoutePlan route)
{
    if (route.Empty())
    {
        fmt::print(stderr, "RouteService: no route available\n");
    }

    PushEvent({IRouteListener::EventType::kReady,
               std::make_shared<const RoutePlan>(std::move(route))});
}

void
RouteService::PublishOsrmResponse(std::string_view response)
{
    Publish(route::ParseOsrmResponse(response));
}

void
RouteService::Release()
{
    PushEvent({IRouteListener::EventType::kReleased, nullptr});
}

void
RouteService::PushEvent(const IRouteListener::Event& event)
{
    std::lock_guard lock(m_mutex);

    for (auto listener : m_listeners)
    {
        listener->PushEvent(event);
    }
}

void
RouteService::Detach(const RouteListenerImpl* listener)
{
    std::lock_guard lock(m_mutex);

    if (auto it = std::ranges::find(m_listeners, listener); it != m_listeners.end())
    {
        m_listeners.erase(it);
    }
}
