#pragma once

#include "gps_position.hh"
#include "semaphore.hh"
#include "time.hh"

#include <memory>
#include <optional>

struct Fix
{
    GpsPosition position;
    std::optional<float> speed; // m/s
    milliseconds timestamp {0};
};

class IPositionPort
{
public:
    enum class EventType : uint8_t
    {
        kFix,         // A new position
        kUnavailable, // Neither the stream nor the fallback produced a position

        kValueCount,
    };

    struct Event
    {
        EventType type;

        // Valid for kFix
        Fix fix;
    };

    virtual ~IPositionPort() = default;

    void AwakeOn(os::binary_semaphore& semaphore)
    {
        DoAwakeOn(&semaphore);
    }

    void DisableWakeup()
    {
        DoAwakeOn(nullptr);
    }

    // The next event, in order of arrival
    virtual std::optional<Event> Poll() = 0;

protected:
    virtual void DoAwakeOn(os::binary_semaphore* semaphore) = 0;
};

class IPositionFeed
{
public:
    virtual ~IPositionFeed() = default;

    /**
     * @brief Subscribe to the position stream
     *
     * @return the port to poll. Releasing it cancels the subscription
     */
    virtual std::unique_ptr<IPositionPort> AttachListener() = 0;
};
