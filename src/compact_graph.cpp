/*
  CompactGraph — immutable CSR snapshot of one weight attribute.

  Construction reads the weight of every MultiDiGraph edge, drops edges
  without a value, optionally reduces parallel edges to the cheapest one per
  ordered pair, and compacts the rest into CSR adjacency using a stable
  (src, dst, weight) ordering so parallel edges of a pair are contiguous.
*/
#include "roadnet/core/compact_graph.hpp"

#include <algorithm>
#include <numeric>

#include "roadnet/core/verify.hpp"

namespace roadnet::core {

CompactGraph CompactGraph::from_multidigraph(
    const MultiDiGraph& g, std::string_view weight, bool one_edge_per_pair) {
  CompactGraph cg;
  cg.num_nodes_ = g.num_nodes();

  // Gather usable edges
  std::vector<NodeIndex> src_v;
  std::vector<NodeIndex> dst_v;
  std::vector<Weight> w_v;
  std::vector<EdgeIndex> origin_v;
  src_v.reserve(static_cast<std::size_t>(g.num_edges()));
  dst_v.reserve(static_cast<std::size_t>(g.num_edges()));
  w_v.reserve(static_cast<std::size_t>(g.num_edges()));
  origin_v.reserve(static_cast<std::size_t>(g.num_edges()));
  for (EdgeIndex e = 0; e < g.num_edges(); ++e) {
    auto w = edge_weight(g, e, weight);
    if (!w) continue;
    const auto& ed = g.edge(e);
    src_v.push_back(ed.src);
    dst_v.push_back(ed.dst);
    w_v.push_back(*w);
    origin_v.push_back(e);
  }
  std::size_t m = src_v.size();

  // Sort by (src, dst, weight); stable, so equal weights keep insertion order.
  std::vector<std::size_t> idx(m);
  std::iota(idx.begin(), idx.end(), 0);
  std::stable_sort(idx.begin(), idx.end(), [&](std::size_t a, std::size_t b) {
    if (src_v[a] != src_v[b]) return src_v[a] < src_v[b];
    if (dst_v[a] != dst_v[b]) return dst_v[a] < dst_v[b];
    return w_v[a] < w_v[b];
  });
  if (one_edge_per_pair) {
    // First entry of every (src, dst) run is its cheapest edge.
    auto last = std::unique(idx.begin(), idx.end(), [&](std::size_t a, std::size_t b) {
      return src_v[a] == src_v[b] && dst_v[a] == dst_v[b];
    });
    idx.erase(last, idx.end());
    m = idx.size();
  }
  auto apply_perm = [&](auto& out_vec, const auto& in_vec) {
    out_vec.resize(m);
    for (std::size_t i = 0; i < m; ++i) out_vec[i] = in_vec[idx[i]];
  };
  apply_perm(cg.src_, src_v);
  apply_perm(cg.dst_, dst_v);
  apply_perm(cg.weight_, w_v);
  apply_perm(cg.origin_, origin_v);

  // Build CSR adjacency
  cg.row_offsets_.assign(static_cast<std::size_t>(cg.num_nodes_) + 1, 0);
  for (std::size_t i = 0; i < m; ++i) {
    cg.row_offsets_[static_cast<std::size_t>(cg.src_[i]) + 1]++;
  }
  for (std::size_t i = 1; i < cg.row_offsets_.size(); ++i) {
    cg.row_offsets_[i] += cg.row_offsets_[i - 1];
  }
  cg.col_indices_.resize(m);
  cg.adj_edge_index_.resize(m);
  std::vector<std::int32_t> cursor = cg.row_offsets_;
  for (std::size_t e = 0; e < m; ++e) {
    auto u = cg.src_[e];
    auto pos = static_cast<std::size_t>(cursor[static_cast<std::size_t>(u)]++);
    cg.col_indices_[pos] = cg.dst_[e];
    cg.adj_edge_index_[pos] = static_cast<std::int32_t>(e);
  }
  return cg;
}

} // namespace roadnet::core
