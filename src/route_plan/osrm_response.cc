// https://project-osrm.org/docs/v5.24.0/api/#route-service
#include "route_plan.hh"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace
{

// GeoJSON and OSRM use [longitude, latitude]
std::optional<GpsPosition>
ToPosition(const json& pair)
{
    if (!pair.is_array() || pair.size() < 2 || !pair[0].is_number() || !pair[1].is_number())
    {
        return std::nullopt;
    }

    auto out = GpsPosition {.latitude = pair[1].get<double>(), .longitude = pair[0].get<double>()};
    if (!out.IsValid())
    {
        return std::nullopt;
    }

    return out;
}

std::optional<ManeuverStep>
ToStep(const json& step)
{
    const auto& maneuver = step.at("maneuver");
    auto location = ToPosition(maneuver.at("location"));

    if (!location)
    {
        return std::nullopt;
    }

    auto instruction = maneuver.at("type").get<std::string>();
    if (auto modifier = maneuver.find("modifier");
        modifier != maneuver.end() && modifier->is_string())
    {
        instruction += " " + modifier->get<std::string>();
    }

    return ManeuverStep {.instruction = std::move(instruction),
                         .location = *location,
                         .distance_meters = step.value("distance", 0.0)};
}

RoutePlan
DecodeRoute(const json& response)
{
    if (response.value("code", "Ok") != "Ok")
    {
        fmt::print(stderr,
                   "Route: service replied {}: {}\n",
                   response.value("code", ""),
                   response.value("message", ""));
        return {};
    }

    const auto& routes = response.at("routes");
    if (!routes.is_array() || routes.empty())
    {
        fmt::print(stderr, "Route: no route in the response\n");
        return {};
    }

    const auto& route = routes[0];
    std::vector<GpsPosition> points;
    std::vector<ManeuverStep> steps;

    for (const auto& coordinate : route.at("geometry").at("coordinates"))
    {
        auto position = ToPosition(coordinate);
        if (!position)
        {
            fmt::print(stderr, "Route: invalid coordinate {}\n", coordinate.dump());
            return {};
        }
        points.push_back(*position);
    }

    if (auto legs = route.find("legs"); legs != route.end())
    {
        for (const auto& leg : *legs)
        {
            for (const auto& step : leg.value("steps", json::array()))
            {
                auto maneuver = ToStep(step);
                if (!maneuver)
                {
                    fmt::print(stderr, "Route: invalid maneuver {}\n", step.dump());
                    return {};
                }
                steps.push_back(std::move(*maneuver));
            }
        }
    }

    return RoutePlan(std::move(points), std::move(steps));
}

} // namespace

RoutePlan
route::ParseOsrmResponse(std::string_view text)
{
    auto response = json::parse(text, nullptr, false);

    if (response.is_discarded() || !response.is_object())
    {
        fmt::print(stderr, "Route: the response is not a JSON object\n");
        return {};
    }

    try
    {
        return DecodeRoute(response);
    }
    catch (const json::exception& e)
    {
        fmt::print(stderr, "Route: malformed response: {}\n", e.what());
    }

    return {};
}
