#pragma once

#include <gtest/gtest.h>
#include <algorithm>
#include <functional>
#include <limits>
#include <set>
#include <string>
#include <vector>
#include "roadnet/core/multidigraph.hpp"
#include "roadnet/core/route.hpp"
#include "roadnet/core/types.hpp"

namespace roadnet::core::test {

inline AttributeMap len(double length) {
  return AttributeMap{{"length", length}};
}

inline AttributeMap road(double length, std::string highway, AttrValue maxspeed = Null{}) {
  AttributeMap attrs{{"length", length}, {"highway", std::move(highway)}};
  if (!std::holds_alternative<Null>(maxspeed)) attrs.emplace("maxspeed", std::move(maxspeed));
  return attrs;
}

// Graph builders
inline MultiDiGraph make_line_graph(int n) {
  // Simple line graph 0->1->2->...->n-1, unit lengths
  MultiDiGraph g;
  for (int i = 0; i < n; ++i) g.add_node(static_cast<NodeId>(i));
  for (int i = 0; i + 1 < n; ++i) g.add_edge(static_cast<NodeId>(i), static_cast<NodeId>(i + 1), len(1.0));
  return g;
}

inline MultiDiGraph make_square_graph(int type = 1) {
  // Type 1: one shortest route and one longer alternative
  // 0->1->2 (length 2) vs 0->3->2 (length 4)
  // Type 2: two equal-length routes
  MultiDiGraph g;
  const double alt = (type == 1) ? 2.0 : 1.0;
  g.add_edge(0, 1, len(1.0));
  g.add_edge(1, 2, len(1.0));
  g.add_edge(0, 3, len(alt));
  g.add_edge(3, 2, len(alt));
  return g;
}

inline MultiDiGraph make_grid_graph(int rows, int cols) {
  // Grid with edges going right and down; node id = r * cols + c
  MultiDiGraph g;
  for (int r = 0; r < rows; ++r) {
    for (int c = 0; c < cols; ++c) {
      auto node = static_cast<NodeId>(r * cols + c);
      g.add_node(node);
      if (c < cols - 1) g.add_edge(node, node + 1, len(1.0 + static_cast<double>((r + c) % 3)));
      if (r < rows - 1) g.add_edge(node, node + static_cast<NodeId>(cols), len(1.0 + static_cast<double>((r * c) % 2)));
    }
  }
  return g;
}

inline double number_attr(const MultiDiGraph& g, NodeId u, NodeId v, EdgeKey key, std::string_view name) {
  auto e = g.find_edge(u, v, key);
  if (!e) return std::numeric_limits<double>::quiet_NaN();
  const AttrValue* value = g.edge_attribute(*e, name);
  if (!value || !std::holds_alternative<double>(*value)) return std::numeric_limits<double>::quiet_NaN();
  return std::get<double>(*value);
}

// Weights of every simple path s->t (brute force; small graphs only).
inline std::vector<double> all_simple_path_weights(const MultiDiGraph& g, NodeId s, NodeId t,
                                                   std::string_view weight = "length") {
  std::vector<double> out;
  Path current{s};
  std::set<NodeId> on_path{s};
  std::function<void(NodeId)> dfs = [&](NodeId u) {
    if (u == t) { out.push_back(route_weight(g, current, weight)); return; }
    auto ui = g.node_index(u);
    for (auto e : g.out_edges(ui)) {
      NodeId v = g.node_id(g.edge(e).dst);
      if (on_path.count(v)) continue;
      current.push_back(v); on_path.insert(v);
      dfs(v);
      current.pop_back(); on_path.erase(v);
    }
  };
  dfs(s);
  std::sort(out.begin(), out.end());
  return out;
}

// Assertion helpers
inline void expect_path_valid(const MultiDiGraph& g, const Path& path, NodeId s, NodeId t) {
  ASSERT_FALSE(path.empty());
  EXPECT_EQ(path.front(), s);
  EXPECT_EQ(path.back(), t);
  std::set<NodeId> visited;
  for (auto n : path) {
    EXPECT_TRUE(visited.insert(n).second) << "Node " << n << " appears twice in path (cycle)";
  }
  for (std::size_t i = 0; i + 1 < path.size(); ++i) {
    EXPECT_FALSE(g.edges_between(path[i], path[i + 1]).empty())
        << "No edge " << path[i] << " -> " << path[i + 1];
  }
}

} // namespace roadnet::core::test
