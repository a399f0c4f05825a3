/* Shortest paths (Dijkstra) over a MultiDiGraph: single pair and batch. */
#pragma once

#include <optional>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

#include "roadnet/core/compact_graph.hpp"
#include "roadnet/core/constants.hpp"
#include "roadnet/core/executor.hpp"
#include "roadnet/core/multidigraph.hpp"
#include "roadnet/core/options.hpp"
#include "roadnet/core/types.hpp"

namespace roadnet::core {

// One concrete path in snapshot coordinates: node indices, the compact edge
// ids between them (nodes.size() - 1 entries) and its total weight.
struct IndexPath {
  std::vector<NodeIndex> nodes;
  std::vector<std::int32_t> edges;
  Weight cost {0.0};
};

// Single-target Dijkstra over a snapshot. For each neighbor the cheapest
// parallel edge is relaxed (ties: smallest compact edge id).
// Optional masks: node_mask[v] == 0 excludes node v, edge_mask[e] == 0
// excludes compact edge e; empty spans are ignored.
// Returns nullopt when dst is unreachable.
[[nodiscard]] std::optional<IndexPath>
dijkstra_path(const CompactGraph& g, NodeIndex src, NodeIndex dst,
              std::span<const std::uint8_t> node_mask = {},
              std::span<const std::uint8_t> edge_mask = {});

// Minimum-weight path orig -> dest. Verifies `weight` first. Unreachable
// destinations yield NotFound (logged at warning level). Throws NodeNotFound
// for unknown node ids.
[[nodiscard]] PathResult shortest_path(const MultiDiGraph& g, NodeId orig, NodeId dest,
                                       std::string_view weight = kLengthAttr);

// Batch: one result per (origs[i], dests[i]) in input order. Throws
// MismatchedLengths or NodeNotFound before any search starts.
[[nodiscard]] std::vector<PathResult>
shortest_paths(const MultiDiGraph& g, std::span<const NodeId> origs,
               std::span<const NodeId> dests, const RoutingOptions& opts = {});

// Batch with a caller-supplied executor; opts.cpus is ignored.
[[nodiscard]] std::vector<PathResult>
shortest_paths(const MultiDiGraph& g, std::span<const NodeId> origs,
               std::span<const NodeId> dests, std::string_view weight,
               Executor& executor);

// Origin/destination given either as one node or as a sequence of nodes.
using NodeSelector = std::variant<NodeId, std::vector<NodeId>>;
using ShortestPathOutput = std::variant<PathResult, std::vector<PathResult>>;

// Both scalars: single-pair result. Both sequences: batch results. Exactly
// one sequence: throws MixedCardinality.
[[nodiscard]] ShortestPathOutput
shortest_path(const MultiDiGraph& g, const NodeSelector& orig, const NodeSelector& dest,
              const RoutingOptions& opts);

} // namespace roadnet::core
