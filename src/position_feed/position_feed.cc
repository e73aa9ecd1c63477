#include "position_feed.hh"

#include <algorithm>
#include <cassert>
#include <etl/queue_spsc_atomic.h>
#include <fmt/format.h>
#include <mutex>

class PositionFeed::PositionPortImpl : public IPositionPort
{
public:
    explicit PositionPortImpl(PositionFeed& parent)
        : m_parent(parent)
    {
    }

    ~PositionPortImpl() final
    {
        // Synchronous: nothing is pushed to this port once detached
        m_parent.Detach(this);
    }

    void PushEvent(const Event& event)
    {
        if (!m_events.push(event))
        {
            fmt::print(stderr, "PositionFeed: listener queue full, dropping event\n");
            return;
        }

        if (m_semaphore)
        {
            m_semaphore->release();
        }
    }

private:
    void DoAwakeOn(os::binary_semaphore* semaphore) final
    {
        // Read by PushEvent on the feed thread, under the same lock
        std::lock_guard lock(m_parent.m_mutex);

        m_semaphore = semaphore;
    }

    std::optional<Event> Poll() final
    {
        Event event;

        if (m_events.pop(event))
        {
            return event;
        }

        return std::nullopt;
    }

    PositionFeed& m_parent;
    etl::queue_spsc_atomic<Event, 16> m_events;
    os::binary_semaphore* m_semaphore {nullptr};
};


PositionFeed::PositionFeed(hal::IPositionSource& source, milliseconds fallback_fix_timeout)
    : m_source(source)
    , m_fallback_fix_timeout(fallback_fix_timeout)
{
}

std::unique_ptr<IPositionPort>
PositionFeed::AttachListener()
{
    std::lock_guard lock(m_mutex);

    assert(!m_listeners.full());

    auto out = std::make_unique<PositionPortImpl>(*this);
    m_listeners.push_back(out.get());

    return out;
}

std::optional<milliseconds>
PositionFeed::OnActivation()
{
    auto data = m_source.WaitForData(GetSemaphore());
    std::optional<milliseconds> next_wakeup;

    if (!data)
    {
        // Nothing wakes the thread after a stream error, so retry on a timer
        fmt::print(stderr, "PositionFeed: position stream error, trying fallback\n");
        data = Fallback();
        next_wakeup = kStreamRetryTime;
    }

    if (!data)
    {
        fmt::print(stderr, "PositionFeed: no position available\n");
        Deliver({.type = IPositionPort::EventType::kUnavailable, .fix = {}});

        return next_wakeup;
    }

    if (!data->position)
    {
        // Speed only etc, wait for a complete fix
        return next_wakeup;
    }

    auto fix = Fix {.position = *data->position,
                    .speed = data->speed,
                    .timestamp = data->timestamp.value_or(os::GetTimeStamp())};

    Deliver({.type = IPositionPort::EventType::kFix, .fix = fix});

    return next_wakeup;
}

std::optional<hal::RawFix>
PositionFeed::Fallback()
{
    if (auto last_known = m_source.LastKnownPosition(); last_known && last_known->position)
    {
        return last_known;
    }

    if (auto fresh = m_source.RequestSingleFix(m_fallback_fix_timeout); fresh && fresh->position)
    {
        return fresh;
    }

    return std::nullopt;
}

void
PositionFeed::Deliver(const IPositionPort::Event& event)
{
    std::lock_guard lock(m_mutex);

    for (auto listener : m_listeners)
    {
        listener->PushEvent(event);
    }
}

void
PositionFeed::Detach(const PositionPortImpl* port)
{
    std::lock_guard lock(m_mutex);

    if (auto it = std::ranges::find(m_listeners, port); it != m_listeners.end())
    {
        m_listeners.erase(it);
    }
}
