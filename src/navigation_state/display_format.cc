#include "display_format.hh"

#include <cmath>
#include <fmt/format.h>

std::string
display::FormatDistance(double meters)
{
    if (meters >= 1000)
    {
        return fmt::format("{:.1f} km", meters / 1000);
    }

    return fmt::format("{:.0f} m", meters);
}

std::string
display::FormatDuration(std::chrono::seconds duration)
{
    return fmt::format("{} min", std::chrono::round<std::chrono::minutes>(duration).count());
}

std::string
display::FormatBearing(double degrees)
{
    return fmt::format("{:.0f}°", std::fmod(std::round(degrees), 360.0));
}
