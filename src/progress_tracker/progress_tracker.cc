#include "progress_tracker.hh"

#include "geo.hh"

#include <algorithm>
#include <cmath>
#include <limits>

void
ProgressTracker::SetRoute(std::shared_ptr<const RoutePlan> route)
{
    Reset();

    m_route = std::move(route);
}

void
ProgressTracker::Reset()
{
    m_route = nullptr;
    m_cursor = {};
    m_last_snap_distance = 0;
}

GpsPosition
ProgressTracker::Snap(const GpsPosition& raw)
{
    if (!m_route || m_route->Empty())
    {
        m_last_snap_distance = 0;
        return raw;
    }

    auto points = m_route->Points();
    auto min_distance = std::numeric_limits<double>::infinity();
    auto closest_index = m_cursor.last_index;

    for (auto i = m_cursor.last_index; i < points.size(); i++)
    {
        auto distance = geo::DistanceMeters(raw, points[i]);

        if (distance < min_distance)
        {
            min_distance = distance;
            closest_index = i;
        }
    }

    m_cursor.last_index = closest_index;
    m_last_snap_distance = min_distance;

    return points[closest_index];
}

std::span<const GpsPosition>
ProgressTracker::RemainingRoute() const
{
    if (!m_route)
    {
        return {};
    }

    return m_route->Points().subspan(std::min(m_cursor.last_index, m_route->Points().size()));
}

std::optional<double>
ProgressTracker::Bearing(const GpsPosition& snapped) const
{
    auto remaining = RemainingRoute();

    if (remaining.size() < 2 || remaining[1] == snapped)
    {
        return std::nullopt;
    }

    return geo::BearingDegrees(snapped, remaining[1]);
}

double
ProgressTracker::DistanceToDestination(const GpsPosition& current) const
{
    auto remaining = RemainingRoute();

    if (remaining.empty())
    {
        if (auto destination = m_route ? m_route->Destination() : std::nullopt; destination)
        {
            return geo::DistanceMeters(current, *destination);
        }

        return 0;
    }

    auto meters = geo::DistanceMeters(current, remaining.front());

    return meters + geo::PolylineLengthMeters(remaining);
}

std::chrono::seconds
ProgressTracker::EstimatedTimeRemaining(double distance_meters,
                                        std::optional<float> speed,
                                        float fallback_speed)
{
    auto meters_per_second = speed && *speed > 0 ? *speed : fallback_speed;

    if (meters_per_second <= 0)
    {
        return std::chrono::seconds(0);
    }

    // A near-zero speed would overflow the conversion, saturate instead
    auto estimate = std::clamp(distance_meters / meters_per_second,
                               0.0,
                               static_cast<double>(kMaxEstimatedTime.count()));

    return std::chrono::seconds(std::llround(estimate));
}
