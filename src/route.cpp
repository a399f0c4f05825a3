#include "roadnet/core/route.hpp"

#include <limits>
#include <string>

#include "roadnet/core/error.hpp"
#include "roadnet/core/verify.hpp"

namespace roadnet::core {

namespace {

// Cheapest edge u->v under `weight`; unweighted edges rank last, ties go to
// the lowest key.
EdgeIndex select_edge(const MultiDiGraph& g, NodeId u, NodeId v, std::string_view weight) {
  (void)g.node_index(u);
  (void)g.node_index(v);
  auto candidates = g.edges_between(u, v);
  if (candidates.empty()) {
    throw DisconnectedPair("no edge connects node " + std::to_string(u) + " to node " +
                           std::to_string(v));
  }
  EdgeIndex best = -1;
  Weight best_w = std::numeric_limits<Weight>::infinity();
  bool best_weighted = false;
  for (auto e : candidates) {
    auto w = edge_weight(g, e, weight);
    const bool better = [&] {
      if (best < 0) return true;
      if (w.has_value() != best_weighted) return w.has_value();
      if (w && *w != best_w) return *w < best_w;
      return g.edge(e).key < g.edge(best).key;
    }();
    if (better) {
      best = e;
      best_weighted = w.has_value();
      best_w = w.value_or(std::numeric_limits<Weight>::infinity());
    }
  }
  return best;
}

} // namespace

std::vector<EdgeRef> route_to_edges(const MultiDiGraph& g, std::span<const NodeId> route,
                                    std::string_view weight) {
  std::vector<EdgeRef> out;
  if (route.size() < 2) return out;
  out.reserve(route.size() - 1);
  for (std::size_t i = 0; i + 1 < route.size(); ++i) {
    out.push_back(g.edge_ref(select_edge(g, route[i], route[i + 1], weight)));
  }
  return out;
}

Weight route_weight(const MultiDiGraph& g, std::span<const NodeId> route, std::string_view weight) {
  Weight total = 0.0;
  for (std::size_t i = 0; i + 1 < route.size(); ++i) {
    auto e = select_edge(g, route[i], route[i + 1], weight);
    auto w = edge_weight(g, e, weight);
    if (!w) {
      throw NullAttribute("edge (" + std::to_string(route[i]) + ", " + std::to_string(route[i + 1]) +
                          ") has no value for '" + std::string(weight) + "'");
    }
    total += *w;
  }
  return total;
}

} // namespace roadnet::core
