#pragma once

#include "gps_position.hh"

#include <span>

namespace geo
{

// WGS-84 equatorial radius
constexpr auto kEarthRadiusMeters = 6378137.0;

/**
 * @brief Great-circle distance between two positions (haversine)
 *
 * @return the distance in meters, symmetric and 0 for equal positions
 */
double DistanceMeters(const GpsPosition& a, const GpsPosition& b);

/**
 * @brief Initial compass bearing from @a from towards @a to
 *
 * @return the bearing in degrees, [0, 360). 0 if the positions are equal
 */
double BearingDegrees(const GpsPosition& from, const GpsPosition& to);

// Sum of the segment lengths of a polyline
double PolylineLengthMeters(std::span<const GpsPosition> points);

} // namespace geo
