#pragma once

#include "gps_position.hh"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

struct ManeuverStep
{
    std::string instruction;
    GpsPosition location;
    double distance_meters {0};

    bool operator==(const ManeuverStep& other) const = default;
};

// A planned route. Immutable once created, an empty route means "no route"
class RoutePlan
{
public:
    RoutePlan() = default;

    RoutePlan(std::vector<GpsPosition> points, std::vector<ManeuverStep> steps);

    std::span<const GpsPosition> Points() const
    {
        return m_points;
    }

    std::span<const ManeuverStep> Steps() const
    {
        return m_steps;
    }

    bool Empty() const
    {
        return m_points.empty();
    }

    // The last point of the route
    std::optional<GpsPosition> Destination() const;

    double LengthMeters() const
    {
        return m_length_meters;
    }

private:
    std::vector<GpsPosition> m_points;
    std::vector<ManeuverStep> m_steps;
    double m_length_meters {0};
};

namespace route
{

/**
 * @brief Decode an OSRM route/v1 response (geojson geometry, with steps)
 *
 * @param json the response body
 * @return the route, or an empty route if the response is malformed or has no route
 */
RoutePlan ParseOsrmResponse(std::string_view json);

} // namespace route
