#pragma once

struct GpsPosition
{
    double latitude;
    double longitude;

    bool IsValid() const
    {
        return latitude >= -90 && latitude <= 90 && longitude >= -180 && longitude <= 180;
    }

    bool operator==(const GpsPosition& other) const = default;
};
