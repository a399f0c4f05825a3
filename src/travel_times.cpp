#include "roadnet/core/travel_times.hpp"

#include <string>
#include <vector>

#include "roadnet/core/constants.hpp"
#include "roadnet/core/error.hpp"

namespace roadnet::core {

void add_edge_travel_times(MultiDiGraph& g) {
  const auto m = static_cast<std::size_t>(g.num_edges());
  if (m == 0) return;

  // Verify edge length and speed_kph attributes exist
  std::size_t has_length = 0;
  std::size_t has_speed = 0;
  for (EdgeIndex e = 0; e < g.num_edges(); ++e) {
    if (g.edge_attribute(e, kLengthAttr)) ++has_length;
    if (g.edge_attribute(e, kSpeedAttr)) ++has_speed;
  }
  if (has_length == 0 || has_speed == 0) {
    throw MissingAttribute("All edges must have 'length' and 'speed_kph' attributes.");
  }

  // Verify they contain no nulls, then convert meters and km/h to seconds
  std::vector<double> travel_time(m);
  for (EdgeIndex e = 0; e < g.num_edges(); ++e) {
    const AttrValue* len_v = g.edge_attribute(e, kLengthAttr);
    const AttrValue* spd_v = g.edge_attribute(e, kSpeedAttr);
    auto length = len_v ? to_number(*len_v, kLengthAttr) : std::nullopt;
    auto speed = spd_v ? to_number(*spd_v, kSpeedAttr) : std::nullopt;
    if (!length || !speed) {
      const auto ref = g.edge_ref(e);
      throw NullAttribute("Edge 'length' and 'speed_kph' values must be non-null (edge " +
                          std::to_string(ref.u) + ", " + std::to_string(ref.v) + ", " +
                          std::to_string(ref.key) + ").");
    }
    const double distance_km = *length / 1000.0;
    const double speed_km_sec = *speed / (60.0 * 60.0);
    travel_time[static_cast<std::size_t>(e)] = distance_km / speed_km_sec;
  }

  for (EdgeIndex e = 0; e < g.num_edges(); ++e) {
    g.set_edge_attribute(e, kTravelTimeAttr, travel_time[static_cast<std::size_t>(e)]);
  }
}

} // namespace roadnet::core
