#pragma once

#include "time.hh"

struct NavigationConfig
{
    // 50 km/h, for when the host navigates a car
    static constexpr float kVehicleFallbackSpeed = 50.0f * 1000 / 3600;
    static constexpr float kPedestrianFallbackSpeed = 5.0f;

    // Raw fixes closer than this to the last accepted one are ignored
    double min_movement_meters {5};

    // Used for the ETA when the fix carries no (positive) speed, m/s
    float fallback_speed {kPedestrianFallbackSpeed};

    // A maneuver is announced when the traveler is closer than this
    double maneuver_radius_meters {30};

    // Bound for the single fix requested when the position stream fails
    milliseconds fallback_fix_timeout {30s};

    static NavigationConfig Vehicle()
    {
        return NavigationConfig {.fallback_speed = kVehicleFallbackSpeed};
    }
};
