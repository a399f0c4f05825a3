#pragma once

#include <string_view>

namespace roadnet::core {

// Edge attribute names shared with the graph-building collaborators.
inline constexpr std::string_view kLengthAttr = "length";
inline constexpr std::string_view kHighwayAttr = "highway";
inline constexpr std::string_view kMaxSpeedAttr = "maxspeed";
inline constexpr std::string_view kSpeedAttr = "speed_kph";
inline constexpr std::string_view kTravelTimeAttr = "travel_time";

inline constexpr double kMilesToKm = 1.60934;
inline constexpr double kKnotsToKm = 1.852;

} // namespace roadnet::core
