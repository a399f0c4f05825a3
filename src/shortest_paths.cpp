/*
  shortest_paths — Dijkstra over a CompactGraph snapshot.

  Features:
    - Cheapest-parallel-edge relaxation per neighbor group with deterministic
      tie-breaking by compact edge id.
    - Optional node/edge masks (used by the k-shortest-paths spur searches).
    - Early exit once the destination is settled.
    - Batch solving over one shared read-only snapshot, scheduled by an
      Executor; results land in input order.
*/
#include "roadnet/core/shortest_paths.hpp"

#include <cmath>
#include <limits>
#include <queue>
#include <string>
#include <utility>

#include "roadnet/core/error.hpp"
#include "roadnet/core/log.hpp"
#include "roadnet/core/verify.hpp"

namespace roadnet::core {

std::optional<IndexPath>
dijkstra_path(const CompactGraph& g, NodeIndex src, NodeIndex dst,
              std::span<const std::uint8_t> node_mask,
              std::span<const std::uint8_t> edge_mask) {
  const auto row = g.row_offsets_view();
  const auto col = g.col_indices_view();
  const auto aei = g.adj_edge_index_view();
  const auto weight = g.weight_view();
  const int N = g.num_nodes();
  if (src < 0 || dst < 0 || src >= N || dst >= N) return std::nullopt;
  const bool use_node_mask = node_mask.size() == static_cast<std::size_t>(N);
  const bool use_edge_mask = edge_mask.size() == static_cast<std::size_t>(g.num_edges());
  auto ok_node = [&](NodeIndex v){ return !use_node_mask || node_mask[static_cast<std::size_t>(v)] != 0; };
  auto ok_edge = [&](std::size_t e){ return !use_edge_mask || edge_mask[e] != 0; };
  if (!ok_node(src) || !ok_node(dst)) return std::nullopt;

  std::vector<Weight> dist(static_cast<std::size_t>(N), std::numeric_limits<Weight>::infinity());
  std::vector<NodeIndex> parent(static_cast<std::size_t>(N), -1);
  std::vector<std::int32_t> via(static_cast<std::size_t>(N), -1);
  using QItem = std::pair<Weight, NodeIndex>;
  auto cmp = [](const QItem& a, const QItem& b){ return a.first > b.first; };
  std::priority_queue<QItem, std::vector<QItem>, decltype(cmp)> pq(cmp);
  dist[static_cast<std::size_t>(src)] = 0.0;
  pq.emplace(0.0, src);
  while (!pq.empty()) {
    auto [d_u, u] = pq.top(); pq.pop();
    if (d_u > dist[static_cast<std::size_t>(u)]) continue;
    if (u == dst) break;
    auto start = static_cast<std::size_t>(row[static_cast<std::size_t>(u)]);
    auto end   = static_cast<std::size_t>(row[static_cast<std::size_t>(u)+1]);
    std::size_t i = start;
    while (i < end) {
      NodeIndex v = col[i];
      // Skip neighbor group if node masked
      if (!ok_node(v)) { std::size_t j=i; while (j<end && col[j]==v) ++j; i=j; continue; }
      // Find best edge u->v (min weight; tie-breaker: smallest edge id)
      Weight min_edge_w = std::numeric_limits<Weight>::infinity();
      std::int32_t best_eid = -1;
      std::size_t j = i;
      for (; j < end && col[j] == v; ++j) {
        auto eidx = static_cast<std::size_t>(aei[j]);
        if (!ok_edge(eidx)) continue;
        Weight ew = weight[eidx];
        if (best_eid < 0 || ew < min_edge_w ||
            (ew == min_edge_w && static_cast<std::int32_t>(eidx) < best_eid)) {
          min_edge_w = ew; best_eid = static_cast<std::int32_t>(eidx);
        }
      }
      if (best_eid >= 0) {
        Weight nd = d_u + min_edge_w;
        auto vi = static_cast<std::size_t>(v);
        if (nd < dist[vi]) { dist[vi] = nd; parent[vi] = u; via[vi] = best_eid; pq.emplace(nd, v); }
      }
      i = j;
    }
  }
  if (!std::isfinite(dist[static_cast<std::size_t>(dst)])) return std::nullopt;
  // Reconstruct
  std::vector<NodeIndex> nodes_rev;
  std::vector<std::int32_t> edges_rev;
  for (NodeIndex v = dst; v != src; v = parent[static_cast<std::size_t>(v)]) {
    if (v < 0) return std::nullopt;
    nodes_rev.push_back(v);
    edges_rev.push_back(via[static_cast<std::size_t>(v)]);
  }
  IndexPath p;
  p.nodes.reserve(nodes_rev.size() + 1);
  p.nodes.push_back(src);
  p.nodes.insert(p.nodes.end(), nodes_rev.rbegin(), nodes_rev.rend());
  p.edges.assign(edges_rev.rbegin(), edges_rev.rend());
  p.cost = dist[static_cast<std::size_t>(dst)];
  return p;
}

namespace {

PathResult solve_pair(const MultiDiGraph& g, const CompactGraph& snap, NodeId orig, NodeId dest) {
  auto found = dijkstra_path(snap, g.node_index(orig), g.node_index(dest));
  if (!found) {
    logger()->warn("Cannot solve path from {} to {}", orig, dest);
    return NotFound{};
  }
  Path path;
  path.reserve(found->nodes.size());
  for (auto v : found->nodes) path.push_back(g.node_id(v));
  return path;
}

void check_equal_lengths(std::span<const NodeId> origs, std::span<const NodeId> dests) {
  if (origs.size() != dests.size()) {
    throw MismatchedLengths("origins and destinations must be of equal length (" +
                            std::to_string(origs.size()) + " != " +
                            std::to_string(dests.size()) + ")");
  }
}

} // namespace

PathResult shortest_path(const MultiDiGraph& g, NodeId orig, NodeId dest, std::string_view weight) {
  verify_edge_attribute(g, weight);
  (void)g.node_index(orig);
  (void)g.node_index(dest);
  auto snap = CompactGraph::from_multidigraph(g, weight, /*one_edge_per_pair=*/false);
  return solve_pair(g, snap, orig, dest);
}

std::vector<PathResult>
shortest_paths(const MultiDiGraph& g, std::span<const NodeId> origs,
               std::span<const NodeId> dests, std::string_view weight,
               Executor& executor) {
  check_equal_lengths(origs, dests);
  verify_edge_attribute(g, weight);
  for (std::size_t i = 0; i < origs.size(); ++i) {
    (void)g.node_index(origs[i]);
    (void)g.node_index(dests[i]);
  }
  logger()->info("Solving {} paths with {} CPUs...", origs.size(), executor.concurrency());

  // One snapshot shared read-only by every job; each job owns one slot.
  const auto snap = CompactGraph::from_multidigraph(g, weight, /*one_edge_per_pair=*/false);
  std::vector<PathResult> out(origs.size(), PathResult{NotFound{}});
  executor.run_indexed(origs.size(), [&](std::size_t i) {
    out[i] = solve_pair(g, snap, origs[i], dests[i]);
  });
  return out;
}

std::vector<PathResult>
shortest_paths(const MultiDiGraph& g, std::span<const NodeId> origs,
               std::span<const NodeId> dests, const RoutingOptions& opts) {
  check_equal_lengths(origs, dests);
  auto executor = make_executor(opts.cpus);
  return shortest_paths(g, origs, dests, opts.weight, *executor);
}

ShortestPathOutput
shortest_path(const MultiDiGraph& g, const NodeSelector& orig, const NodeSelector& dest,
              const RoutingOptions& opts) {
  const bool orig_scalar = std::holds_alternative<NodeId>(orig);
  const bool dest_scalar = std::holds_alternative<NodeId>(dest);
  if (orig_scalar && dest_scalar) {
    return shortest_path(g, std::get<NodeId>(orig), std::get<NodeId>(dest), opts.weight);
  }
  if (orig_scalar != dest_scalar) {
    throw MixedCardinality("origin and destination must either both be sequences or both be single nodes");
  }
  return shortest_paths(g, std::get<std::vector<NodeId>>(orig), std::get<std::vector<NodeId>>(dest), opts);
}

} // namespace roadnet::core
