/*
  MultiDiGraph — append-only directed multigraph with attribute maps.

  Nodes get dense indices in insertion order; each node keeps its outgoing
  edge list in insertion order, which fixes the traversal order seen by the
  algorithms and the key assignment for parallel edges.
*/
#include "roadnet/core/multidigraph.hpp"

#include <stdexcept>
#include <string>

#include "roadnet/core/error.hpp"

namespace roadnet::core {

NodeIndex MultiDiGraph::add_node(NodeId id) {
  auto it = index_.find(id);
  if (it != index_.end()) return it->second;
  auto idx = static_cast<NodeIndex>(node_ids_.size());
  node_ids_.push_back(id);
  out_.emplace_back();
  index_.emplace(id, idx);
  return idx;
}

EdgeKey MultiDiGraph::add_edge(NodeId u, NodeId v, AttributeMap attrs) {
  auto ui = add_node(u);
  auto vi = add_node(v);
  // Lowest key not yet used by a u->v edge.
  EdgeKey key = 0;
  for (;;) {
    bool used = false;
    for (auto e : out_[static_cast<std::size_t>(ui)]) {
      const auto& ed = edges_[static_cast<std::size_t>(e)];
      if (ed.dst == vi && ed.key == key) { used = true; break; }
    }
    if (!used) break;
    ++key;
  }
  auto e = static_cast<EdgeIndex>(edges_.size());
  edges_.push_back(Edge{ui, vi, key, std::move(attrs)});
  out_[static_cast<std::size_t>(ui)].push_back(e);
  return key;
}

EdgeKey MultiDiGraph::add_edge(NodeId u, NodeId v, EdgeKey key, AttributeMap attrs) {
  if (find_edge(u, v, key)) {
    throw std::invalid_argument("edge (" + std::to_string(u) + ", " + std::to_string(v) + ", " +
                                std::to_string(key) + ") already exists");
  }
  auto ui = add_node(u);
  auto vi = add_node(v);
  auto e = static_cast<EdgeIndex>(edges_.size());
  edges_.push_back(Edge{ui, vi, key, std::move(attrs)});
  out_[static_cast<std::size_t>(ui)].push_back(e);
  return key;
}

std::optional<NodeIndex> MultiDiGraph::find_node(NodeId id) const noexcept {
  auto it = index_.find(id);
  if (it == index_.end()) return std::nullopt;
  return it->second;
}

NodeIndex MultiDiGraph::node_index(NodeId id) const {
  auto it = index_.find(id);
  if (it == index_.end()) {
    throw NodeNotFound("node " + std::to_string(id) + " is not in the graph");
  }
  return it->second;
}

EdgeRef MultiDiGraph::edge_ref(EdgeIndex e) const noexcept {
  const auto& ed = edges_[static_cast<std::size_t>(e)];
  return EdgeRef{node_ids_[static_cast<std::size_t>(ed.src)],
                 node_ids_[static_cast<std::size_t>(ed.dst)], ed.key};
}

std::vector<EdgeIndex> MultiDiGraph::edges_between(NodeId u, NodeId v) const {
  std::vector<EdgeIndex> out;
  auto ui = find_node(u);
  auto vi = find_node(v);
  if (!ui || !vi) return out;
  for (auto e : out_[static_cast<std::size_t>(*ui)]) {
    if (edges_[static_cast<std::size_t>(e)].dst == *vi) out.push_back(e);
  }
  return out;
}

std::optional<EdgeIndex> MultiDiGraph::find_edge(NodeId u, NodeId v, EdgeKey key) const {
  for (auto e : edges_between(u, v)) {
    if (edges_[static_cast<std::size_t>(e)].key == key) return e;
  }
  return std::nullopt;
}

const AttrValue* MultiDiGraph::edge_attribute(EdgeIndex e, std::string_view name) const noexcept {
  const auto& attrs = edges_[static_cast<std::size_t>(e)].attrs;
  auto it = attrs.find(name);
  return it == attrs.end() ? nullptr : &it->second;
}

void MultiDiGraph::set_edge_attribute(EdgeIndex e, std::string_view name, AttrValue value) {
  if (e < 0 || e >= num_edges()) {
    throw std::out_of_range("edge index out of range of num_edges");
  }
  auto& attrs = edges_[static_cast<std::size_t>(e)].attrs;
  auto it = attrs.find(name);
  if (it != attrs.end()) {
    it->second = std::move(value);
  } else {
    attrs.emplace(std::string(name), std::move(value));
  }
}

} // namespace roadnet::core
