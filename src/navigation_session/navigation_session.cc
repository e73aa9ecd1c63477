#include "navigation_session.hh"

#include "display_format.hh"
#include "geo.hh"

#include <fmt/format.h>
#include <limits>

NavigationSession::NavigationSession(NavigationState& state, const NavigationConfig& config)
    : m_state(state)
    , m_config(config)
{
}

NavigationSession::Result
NavigationSession::Start(std::shared_ptr<const RoutePlan> route)
{
    if (!route || route->Empty())
    {
        auto state = m_state.Checkout();
        state->last_error = NavigationState::Error::kNoRoute;

        return Result::kNoRoute;
    }

    if (m_route)
    {
        // Already navigating this route, keep the progress
        return m_route == route ? Result::kOk : Result::kInvalidState;
    }

    m_route = std::move(route);
    m_tracker.SetRoute(m_route);
    m_last_accepted = std::nullopt;
    m_current_step_index = 0;

    auto state = m_state.Checkout();
    auto remaining = m_tracker.RemainingRoute();

    state->session = NavigationState::SessionState::kActive;
    state->position = std::nullopt;
    state->bearing = 0;
    state->route_index = 0;
    state->current_step_index = 0;
    state->next_instruction.clear();
    state->track.clear();
    state->remaining_route.assign(remaining.begin(), remaining.end());
    state->distance_to_destination = m_route->LengthMeters();
    state->estimated_time_remaining = ProgressTracker::EstimatedTimeRemaining(
        state->distance_to_destination, std::nullopt, m_config.fallback_speed);
    state->last_error = std::nullopt;

    fmt::print(stderr,
               "Navigation: started, {} points, {} steps, {}\n",
               m_route->Points().size(),
               m_route->Steps().size(),
               display::FormatDistance(m_route->LengthMeters()));

    return Result::kOk;
}

NavigationSession::Result
NavigationSession::Stop()
{
    if (!m_route)
    {
        return Result::kInvalidState;
    }

    m_route = nullptr;
    m_tracker.Reset();
    m_last_accepted = std::nullopt;
    m_current_step_index = 0;

    auto state = m_state.Checkout();

    state->session = NavigationState::SessionState::kIdle;
    state->position = std::nullopt;
    state->bearing = 0;
    state->distance_to_destination = 0;
    state->estimated_time_remaining = std::chrono::seconds(0);
    state->route_index = 0;
    state->current_step_index = 0;
    state->next_instruction.clear();
    state->track.clear();
    state->remaining_route.clear();
    state->update_count = 0;
    state->position_unavailable_count = 0;
    state->last_error = std::nullopt;

    fmt::print(stderr, "Navigation: stopped\n");

    return Result::kOk;
}

void
NavigationSession::OnPositionUpdate(const Fix& fix)
{
    if (!m_route)
    {
        return;
    }

    if (!fix.position.IsValid())
    {
        fmt::print(stderr,
                   "Navigation: dropping invalid position {},{}\n",
                   fix.position.latitude,
                   fix.position.longitude);
        return;
    }

    if (m_last_accepted &&
        geo::DistanceMeters(*m_last_accepted, fix.position) < m_config.min_movement_meters)
    {
        // Jitter
        return;
    }
    m_last_accepted = fix.position;

    auto snapped = m_tracker.Snap(fix.position);
    auto remaining = m_tracker.RemainingRoute();
    auto state = m_state.Checkout();

    if (auto bearing = m_tracker.Bearing(snapped); bearing)
    {
        state->bearing = *bearing;
    }

    state->position = snapped;
    state->route_index = m_tracker.Cursor().last_index;
    state->remaining_route.assign(remaining.begin(), remaining.end());
    state->distance_to_destination = m_tracker.DistanceToDestination(snapped);
    state->estimated_time_remaining = ProgressTracker::EstimatedTimeRemaining(
        state->distance_to_destination, fix.speed, m_config.fallback_speed);
    state->track.push_back(snapped);
    state->update_count++;
    state->last_error = std::nullopt;

    UpdateManeuver(snapped, *state);

    if (m_log_positions)
    {
        LogPosition(fix, *state);
    }
}

void
NavigationSession::OnPositionUnavailable()
{
    if (!m_route)
    {
        return;
    }

    auto state = m_state.Checkout();

    state->position_unavailable_count++;
    state->last_error = NavigationState::Error::kPositionUnavailable;
}

void
NavigationSession::UpdateManeuver(const GpsPosition& position, NavigationState::State& state)
{
    auto steps = m_route->Steps();
    auto min_distance = std::numeric_limits<double>::infinity();
    auto nearest_index = m_current_step_index;

    for (auto i = m_current_step_index; i < steps.size(); i++)
    {
        auto distance = geo::DistanceMeters(position, steps[i].location);

        if (distance < min_distance)
        {
            min_distance = distance;
            nearest_index = i;
        }
    }

    // Strictly forward, so a maneuver is never announced twice
    if (min_distance < m_config.maneuver_radius_meters && nearest_index > m_current_step_index)
    {
        m_current_step_index = nearest_index;

        state.current_step_index = nearest_index;
        state.next_instruction = steps[nearest_index].instruction;

        fmt::print(stderr,
                   "Navigation: step {}: {}\n",
                   nearest_index,
                   state.next_instruction);
    }
}

void
NavigationSession::LogPosition(const Fix& fix, const NavigationState::State& state) const
{
    fmt::print(stderr, "\n=== Position Update ===\n");
    fmt::print(stderr, "Raw Position: {}, {}\n", fix.position.latitude, fix.position.longitude);
    if (state.position)
    {
        fmt::print(stderr,
                   "Snapped Position: {}, {} (index {}, {:.1f} m off)\n",
                   state.position->latitude,
                   state.position->longitude,
                   state.route_index,
                   m_tracker.LastSnapDistance());
    }
    if (fix.speed)
    {
        fmt::print(stderr, "Speed: {} m/s\n", *fix.speed);
    }
    fmt::print(stderr,
               "Distance to destination: {:.2f} meters\n",
               state.distance_to_destination);
    fmt::print(stderr,
               "Estimated time: {}\n",
               display::FormatDuration(state.estimated_time_remaining));
    fmt::print(stderr, "Bearing: {:.1f} degrees\n", state.bearing);
    fmt::print(stderr, "====================\n");
}

const char*
ToString(NavigationSession::Result result)
{
    switch (result)
    {
    case NavigationSession::Result::kOk:
        return "ok";
    case NavigationSession::Result::kNoRoute:
        return "no route";
    case NavigationSession::Result::kInvalidState:
        return "invalid state";
    case NavigationSession::Result::kValueCount:
        break;
    }

    return "unknown";
}
