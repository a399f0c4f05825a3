/* Free-flow edge travel times. */
#pragma once

#include "roadnet/core/multidigraph.hpp"

namespace roadnet::core {

// Add `travel_time` (seconds) to every edge from `length` (meters) and
// `speed_kph`. Throws MissingAttribute when either attribute is absent from
// every edge, NullAttribute when it is missing or null on some edges, and
// InvalidAttributeType for non-numeric values. Nothing is written unless all
// edges pass.
void add_edge_travel_times(MultiDiGraph& g);

} // namespace roadnet::core
