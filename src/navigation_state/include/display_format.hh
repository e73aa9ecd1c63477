#pragma once

#include <chrono>
#include <string>

namespace display
{

// "350 m" below one kilometer, "1.2 km" from there on
std::string FormatDistance(double meters);

// Rounded to whole minutes, "7 min"
std::string FormatDuration(std::chrono::seconds duration);

// "312°"
std::string FormatBearing(double degrees);

} // namespace display
