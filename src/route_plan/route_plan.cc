#include "route_plan.hh"

#include "geo.hh"

RoutePlan::RoutePlan(std::vector<GpsPosition> points, std::vector<ManeuverStep> steps)
    : m_points(std::move(points))
    , m_steps(std::move(steps))
    , m_length_meters(geo::PolylineLengthMeters(m_points))
{
}

std::optional<GpsPosition>
RoutePlan::Destination() const
{
    if (m_points.empty())
    {
        return std::nullopt;
    }

    return m_points.back();
}
