#pragma once

#include "base_thread.hh"
#include "hal/i_position_source.hh"
#include "position_port.hh"

#include <etl/mutex.h>
#include <etl/vector.h>

class PositionFeed : public os::BaseThread, public IPositionFeed
{
public:
    constexpr static auto kMaxListeners = 4;
    constexpr static auto kStreamRetryTime = milliseconds(1000);

    PositionFeed(hal::IPositionSource& source, milliseconds fallback_fix_timeout);

    std::unique_ptr<IPositionPort> AttachListener() final;

private:
    class PositionPortImpl;

    std::optional<milliseconds> OnActivation() final;

    // The stream failed: last known position, else a fresh fix
    std::optional<hal::RawFix> Fallback();

    void Deliver(const IPositionPort::Event& event);
    void Detach(const PositionPortImpl* port);

    hal::IPositionSource& m_source;
    const milliseconds m_fallback_fix_timeout;

    etl::mutex m_mutex;
    etl::vector<PositionPortImpl*, kMaxListeners> m_listeners;
};
