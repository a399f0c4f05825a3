/* Immutable CSR snapshot of one weight attribute over a MultiDiGraph. */
#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "roadnet/core/multidigraph.hpp"
#include "roadnet/core/types.hpp"

namespace roadnet::core {

// Notes on identifiers:
// - Node positions are the MultiDiGraph's NodeIndex values.
// - Compact edge ids index the snapshot's own arrays. Edges are ordered
//   deterministically by (src, dst, weight, source EdgeIndex), so parallel
//   edges of a pair are contiguous with the cheapest first.
// - origin_edge_view() maps a compact edge id back to the MultiDiGraph
//   EdgeIndex it was taken from.
//
// The snapshot owns its arrays and never refers back to the source graph, so
// it can be shared read-only across threads.
class CompactGraph {
public:
  // Build a snapshot of `weight` over g. Edges whose weight is missing or null
  // are left out. With one_edge_per_pair, only the minimum-weight edge of each
  // ordered node pair is kept (ties: lowest EdgeIndex).
  // Throws InvalidAttributeType for non-numeric, negative or infinite weights.
  [[nodiscard]] static CompactGraph from_multidigraph(
      const MultiDiGraph& g, std::string_view weight, bool one_edge_per_pair);

  [[nodiscard]] std::int32_t num_nodes() const noexcept { return num_nodes_; }
  [[nodiscard]] std::int32_t num_edges() const noexcept { return static_cast<std::int32_t>(weight_.size()); }

  [[nodiscard]] std::span<const Weight> weight_view() const noexcept { return weight_; }
  [[nodiscard]] std::span<const NodeIndex> edge_src_view() const noexcept { return src_; }
  [[nodiscard]] std::span<const NodeIndex> edge_dst_view() const noexcept { return dst_; }
  [[nodiscard]] std::span<const EdgeIndex> origin_edge_view() const noexcept { return origin_; }
  [[nodiscard]] std::span<const std::int32_t> row_offsets_view() const noexcept { return row_offsets_; }
  [[nodiscard]] std::span<const NodeIndex> col_indices_view() const noexcept { return col_indices_; }
  [[nodiscard]] std::span<const std::int32_t> adj_edge_index_view() const noexcept { return adj_edge_index_; }

private:
  std::int32_t num_nodes_ {0};
  std::vector<Weight> weight_ {};
  std::vector<NodeIndex> src_ {};
  std::vector<NodeIndex> dst_ {};
  std::vector<EdgeIndex> origin_ {};

  // CSR adjacency for deterministic traversal
  std::vector<std::int32_t> row_offsets_ {};
  std::vector<NodeIndex> col_indices_ {};
  std::vector<std::int32_t> adj_edge_index_ {}; // map CSR entry -> compact edge id
};

} // namespace roadnet::core
