#pragma once

#include "gps_position.hh"
#include "semaphore.hh"

#include <chrono>
#include <cstdint>
#include <etl/mutex.h>
#include <etl/vector.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class NavigationState
{
public:
    constexpr static auto kMaxListeners = 4;

    class IListener
    {
    public:
        virtual ~IListener() = default;
    };

    enum class SessionState : uint8_t
    {
        kIdle,
        kActive,

        kValueCount,
    };

    enum class Error : uint8_t
    {
        kNoRoute,
        kPositionUnavailable,

        kValueCount,
    };

    struct State
    {
        State() = default;
        State(const State&) = default;
        State& operator=(const State&) = default;
        virtual ~State() = default;

        SessionState session {SessionState::kIdle};

        // The snapped position, valid after the first accepted fix
        std::optional<GpsPosition> position;
        double bearing {0};
        double distance_to_destination {0};
        std::chrono::seconds estimated_time_remaining {0};

        size_t route_index {0};
        size_t current_step_index {0};
        std::string next_instruction;

        std::vector<GpsPosition> track;
        std::vector<GpsPosition> remaining_route;

        // Incremented on every accepted position update
        uint32_t update_count {0};
        // Incremented when no position could be had (non-fatal)
        uint32_t position_unavailable_count {0};
        std::optional<Error> last_error;

        bool operator==(const State& other) const = default;
    };

    NavigationState();

    std::unique_ptr<IListener> AttachListener(os::binary_semaphore& semaphore);

    // Checkout a local copy of the state. Published when the unique ptr is released
    std::unique_ptr<State> Checkout();

    // An immutable snapshot of the last published state
    std::shared_ptr<const State> CheckoutReadonly() const;

private:
    class ListenerImpl;
    class StateImpl;

    void Commit(const State& state);
    void Detach(const ListenerImpl* listener);

    std::shared_ptr<const State> m_published;
    mutable etl::mutex m_mutex;
    etl::vector<ListenerImpl*, kMaxListeners> m_listeners;
};

const char* ToString(NavigationState::Error error);
