#pragma once

#include "gps_position.hh"
#include "route_plan.hh"
#include "time.hh"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>

struct TrackingCursor
{
    // Never decreases while the route is the same
    size_t last_index {0};
};

class ProgressTracker
{
public:
    void SetRoute(std::shared_ptr<const RoutePlan> route);

    void Reset();

    /**
     * @brief Snap a raw position to the closest not-yet-passed route point
     *
     * Only points from the cursor and onwards are considered, so the snapped
     * position never moves backwards along the route. Far-off positions still
     * snap to the closest remaining point.
     *
     * @param raw the raw position
     * @return the snapped position, or @a raw if there is no route
     */
    GpsPosition Snap(const GpsPosition& raw);

    /// @brief the route points from the cursor to the end
    std::span<const GpsPosition> RemainingRoute() const;

    /**
     * @brief Bearing from the snapped position towards the next route point
     *
     * @return the bearing, or std::nullopt if there is no next point (or it
     *         coincides with the snapped position)
     */
    std::optional<double> Bearing(const GpsPosition& snapped) const;

    // Road-following distance from @a current through the remaining route
    double DistanceToDestination(const GpsPosition& current) const;

    const TrackingCursor& Cursor() const
    {
        return m_cursor;
    }

    // Distance between the last raw position and where it was snapped
    double LastSnapDistance() const
    {
        return m_last_snap_distance;
    }

    // Upper bound of the estimate, reached for (near) standstill speeds
    static constexpr auto kMaxEstimatedTime = std::chrono::seconds(INT32_MAX);

    static std::chrono::seconds
    EstimatedTimeRemaining(double distance_meters, std::optional<float> speed, float fallback_speed);

private:
    std::shared_ptr<const RoutePlan> m_route;
    TrackingCursor m_cursor;
    double m_last_snap_distance {0};
};
