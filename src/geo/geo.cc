#include "geo.hh"

#include <cmath>
#include <numbers>

namespace
{

constexpr double
ToRadians(double degrees)
{
    return degrees * std::numbers::pi / 180;
}

constexpr double
ToDegrees(double radians)
{
    return radians * 180 / std::numbers::pi;
}

} // namespace

double
geo::DistanceMeters(const GpsPosition& a, const GpsPosition& b)
{
    if (a == b)
    {
        return 0;
    }

    auto d_lat = ToRadians(b.latitude - a.latitude);
    auto d_lon = ToRadians(b.longitude - a.longitude);
    auto sin_lat = std::sin(d_lat / 2);
    auto sin_lon = std::sin(d_lon / 2);

    auto h = sin_lat * sin_lat + std::cos(ToRadians(a.latitude)) *
                                     std::cos(ToRadians(b.latitude)) * sin_lon * sin_lon;

    return 2 * kEarthRadiusMeters * std::atan2(std::sqrt(h), std::sqrt(1 - h));
}

double
geo::BearingDegrees(const GpsPosition& from, const GpsPosition& to)
{
    if (from == to)
    {
        return 0;
    }

    auto lat1 = ToRadians(from.latitude);
    auto lat2 = ToRadians(to.latitude);
    auto d_lon = ToRadians(to.longitude - from.longitude);

    auto y = std::sin(d_lon) * std::cos(lat2);
    auto x = std::cos(lat1) * std::sin(lat2) - std::sin(lat1) * std::cos(lat2) * std::cos(d_lon);

    auto bearing = std::fmod(ToDegrees(std::atan2(y, x)) + 360, 360.0);

    // fmod can round up to exactly 360 for tiny negative angles
    return bearing >= 360 ? 0 : bearing;
}

double
geo::PolylineLengthMeters(std::span<const GpsPosition> points)
{
    auto meters = 0.0;

    for (auto i = 1u; i < points.size(); i++)
    {
        meters += DistanceMeters(points[i - 1], points[i]);
    }

    return meters;
}
