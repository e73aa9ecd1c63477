#pragma once

#include "navigation_config.hh"
#include "navigation_state.hh"
#include "position_port.hh"
#include "progress_tracker.hh"
#include "route_plan.hh"

#include <memory>
#include <optional>

/**
 * @brief The route tracking state machine (Idle/Active)
 *
 * Not thread safe: all calls must be serialized by the owner. Every accepted
 * update is published as one NavigationState snapshot.
 */
class NavigationSession
{
public:
    enum class Result : uint8_t
    {
        kOk,
        kNoRoute,
        kInvalidState,

        kValueCount,
    };

    NavigationSession(NavigationState& state, const NavigationConfig& config);

    /**
     * @brief Start navigating along @a route
     *
     * @return kNoRoute for an empty route, kInvalidState if already navigating
     *         another route without stopping first
     */
    Result Start(std::shared_ptr<const RoutePlan> route);

    Result Stop();

    void OnPositionUpdate(const Fix& fix);

    // Neither the stream nor the fallback produced a position. Not fatal
    void OnPositionUnavailable();

    void SetPositionLogging(bool enabled)
    {
        m_log_positions = enabled;
    }

    bool IsActive() const
    {
        return m_route != nullptr;
    }

    const TrackingCursor& Cursor() const
    {
        return m_tracker.Cursor();
    }

    size_t CurrentStepIndex() const
    {
        return m_current_step_index;
    }

    const ProgressTracker& Tracker() const
    {
        return m_tracker;
    }

private:
    void UpdateManeuver(const GpsPosition& position, NavigationState::State& state);
    void LogPosition(const Fix& fix, const NavigationState::State& state) const;

    NavigationState& m_state;
    const NavigationConfig m_config;

    std::shared_ptr<const RoutePlan> m_route;
    ProgressTracker m_tracker;
    std::optional<GpsPosition> m_last_accepted;
    size_t m_current_step_index {0};

    bool m_log_positions {false};
};

const char* ToString(NavigationSession::Result result);
