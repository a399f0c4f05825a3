/*
  k_shortest_paths — Yen's algorithm over a one-edge-per-pair snapshot.

  Each call to next() deviates from the most recently accepted path: for
  every spur node along it, the root prefix nodes are masked out, the next
  edges of accepted paths sharing the same root are masked out, and a
  Dijkstra search from the spur node to the destination yields a candidate.
  Candidates live in a heap ordered by (weight, discovery order) across calls.
*/
#include "roadnet/core/k_shortest_paths.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "roadnet/core/log.hpp"
#include "roadnet/core/verify.hpp"

namespace roadnet::core {

KShortestPaths::KShortestPaths(const MultiDiGraph& g, NodeId orig, NodeId dest, int k,
                               std::string_view weight) {
  if (k < 0) {
    throw std::invalid_argument("k must be >= 0");
  }
  verify_edge_attribute(g, weight);
  src_ = g.node_index(orig);
  dst_ = g.node_index(dest);
  k_ = static_cast<std::size_t>(k);
  graph_ = CompactGraph::from_multidigraph(g, weight, /*one_edge_per_pair=*/true);
  auto ids = g.node_ids_view();
  node_ids_.assign(ids.begin(), ids.end());
}

std::optional<Path> KShortestPaths::next() {
  if (exhausted_ || accepted_.size() >= k_) return std::nullopt;

  if (!started_) {
    started_ = true;
    auto p0 = dijkstra_path(graph_, src_, dst_);
    if (!p0) {
      logger()->warn("Cannot solve path from {} to {}", node_ids_[static_cast<std::size_t>(src_)],
                     node_ids_[static_cast<std::size_t>(dst_)]);
      exhausted_ = true;
      return std::nullopt;
    }
    seen_.insert(p0->nodes);
    accepted_.push_back(std::move(*p0));
  } else {
    push_spur_candidates(accepted_.back());
    if (candidates_.empty()) {
      exhausted_ = true;
      return std::nullopt;
    }
    Candidate best = candidates_.top();
    candidates_.pop();
    accepted_.push_back(std::move(best.path));
  }
  last_weight_ = accepted_.back().cost;
  return to_path(accepted_.back());
}

void KShortestPaths::push_spur_candidates(const IndexPath& last) {
  const auto weight = graph_.weight_view();
  // Prefix cumulative weights along the last path
  std::vector<Weight> prefix_cost(last.nodes.size(), 0.0);
  for (std::size_t idx = 1; idx < last.nodes.size(); ++idx) {
    prefix_cost[idx] = prefix_cost[idx - 1] + weight[static_cast<std::size_t>(last.edges[idx - 1])];
  }
  std::vector<std::uint8_t> node_mask(static_cast<std::size_t>(graph_.num_nodes()));
  std::vector<std::uint8_t> edge_mask(static_cast<std::size_t>(graph_.num_edges()));

  // Spur node positions 0..len-2
  for (std::size_t j = 0; j + 1 < last.nodes.size(); ++j) {
    const NodeIndex spur_node = last.nodes[j];
    // Exclude root prefix nodes [0..j-1]
    std::fill(node_mask.begin(), node_mask.end(), std::uint8_t{1});
    for (std::size_t r = 0; r < j; ++r) node_mask[static_cast<std::size_t>(last.nodes[r])] = 0;
    // Exclude the next edge of every accepted path sharing the root [0..j]
    std::fill(edge_mask.begin(), edge_mask.end(), std::uint8_t{1});
    for (const auto& P : accepted_) {
      if (P.nodes.size() > j + 1 &&
          std::equal(P.nodes.begin(), P.nodes.begin() + static_cast<std::ptrdiff_t>(j + 1), last.nodes.begin())) {
        edge_mask[static_cast<std::size_t>(P.edges[j])] = 0;
      }
    }
    auto spur = dijkstra_path(graph_, spur_node, dst_, node_mask, edge_mask);
    if (!spur) continue;

    IndexPath cand;
    cand.nodes.reserve(j + spur->nodes.size());
    cand.edges.reserve(j + spur->edges.size());
    cand.nodes.insert(cand.nodes.end(), last.nodes.begin(), last.nodes.begin() + static_cast<std::ptrdiff_t>(j));
    cand.nodes.insert(cand.nodes.end(), spur->nodes.begin(), spur->nodes.end());
    cand.edges.insert(cand.edges.end(), last.edges.begin(), last.edges.begin() + static_cast<std::ptrdiff_t>(j));
    cand.edges.insert(cand.edges.end(), spur->edges.begin(), spur->edges.end());
    cand.cost = prefix_cost[j] + spur->cost;
    if (!seen_.insert(cand.nodes).second) continue;
    candidates_.push(Candidate{cand.cost, next_seq_++, std::move(cand)});
  }
}

Path KShortestPaths::to_path(const IndexPath& p) const {
  Path out;
  out.reserve(p.nodes.size());
  for (auto v : p.nodes) out.push_back(node_ids_[static_cast<std::size_t>(v)]);
  return out;
}

KShortestPaths k_shortest_paths(const MultiDiGraph& g, NodeId orig, NodeId dest,
                                int k, std::string_view weight) {
  return KShortestPaths(g, orig, dest, k, weight);
}

} // namespace roadnet::core
