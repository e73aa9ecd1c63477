#include "navigation_state.hh"

#include <algorithm>
#include <cassert>
#include <mutex>

class NavigationState::ListenerImpl : public NavigationState::IListener
{
public:
    ListenerImpl(NavigationState& parent, os::binary_semaphore& semaphore)
        : m_parent(parent)
        , m_semaphore(semaphore)
    {
    }

    ~ListenerImpl() final
    {
        m_parent.Detach(this);
    }

    void Awake()
    {
        m_semaphore.release();
    }

private:
    NavigationState& m_parent;
    os::binary_semaphore& m_semaphore;
};

class NavigationState::StateImpl : public NavigationState::State
{
public:
    StateImpl(NavigationState& parent, const State& current)
        : State(current)
        , m_parent(parent)
    {
    }

    ~StateImpl() final
    {
        m_parent.Commit(*this);
    }

private:
    NavigationState& m_parent;
};


NavigationState::NavigationState()
    : m_published(std::make_shared<const State>())
{
}

std::unique_ptr<NavigationState::IListener>
NavigationState::AttachListener(os::binary_semaphore& semaphore)
{
    std::lock_guard lock(m_mutex);

    assert(!m_listeners.full());

    auto out = std::make_unique<ListenerImpl>(*this, semaphore);
    m_listeners.push_back(out.get());

    return out;
}

std::unique_ptr<NavigationState::State>
NavigationState::Checkout()
{
    return std::make_unique<StateImpl>(*this, *CheckoutReadonly());
}

std::shared_ptr<const NavigationState::State>
NavigationState::CheckoutReadonly() const
{
    std::lock_guard lock(m_mutex);

    return m_published;
}

void
NavigationState::Commit(const State& state)
{
    std::lock_guard lock(m_mutex);

    if (*m_published == state)
    {
        return;
    }

    // Slice off the checkout, readers keep their old snapshot
    m_published = std::make_shared<const State>(state);
    for (auto listener : m_listeners)
    {
        listener->Awake();
    }
}

void
NavigationState::Detach(const ListenerImpl* listener)
{
    std::lock_guard lock(m_mutex);

    if (auto it = std::ranges::find(m_listeners, listener); it != m_listeners.end())
    {
        m_listeners.erase(it);
    }
}

const char*
ToString(NavigationState::Error error)
{
    switch (error)
    {
    case NavigationState::Error::kNoRoute:
        return "no route";
    case NavigationState::Error::kPositionUnavailable:
        return "position unavailable";
    case NavigationState::Error::kValueCount:
        break;
    }

    return "unknown";
}
