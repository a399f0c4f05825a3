/* Projection of node routes onto concrete multigraph edges. */
#pragma once

#include <span>
#include <string_view>
#include <vector>

#include "roadnet/core/constants.hpp"
#include "roadnet/core/multidigraph.hpp"
#include "roadnet/core/types.hpp"

namespace roadnet::core {

// For each consecutive (u, v) of `route`, the parallel edge with the smallest
// `weight` value. Edges without a value for `weight` rank after all others;
// remaining ties go to the lowest key. Throws DisconnectedPair when a pair has
// no edge at all and NodeNotFound for unknown nodes. Routes with fewer than
// two nodes produce no edges.
[[nodiscard]] std::vector<EdgeRef> route_to_edges(const MultiDiGraph& g, std::span<const NodeId> route,
                                                  std::string_view weight = kLengthAttr);

// Sum of `weight` over the edges chosen by route_to_edges. Throws NullAttribute
// when a chosen edge has no value for `weight`.
[[nodiscard]] Weight route_weight(const MultiDiGraph& g, std::span<const NodeId> route,
                                  std::string_view weight = kLengthAttr);

} // namespace roadnet::core
