/* Directed multigraph with per-edge attribute maps. */
#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "roadnet/core/attribute.hpp"
#include "roadnet/core/types.hpp"

namespace roadnet::core {

// Notes on identifiers:
// - NodeId is the caller's identifier (e.g. an OSM node id). Inside the graph
//   every node also has a dense NodeIndex in insertion order.
// - EdgeIndex is the dense position of an edge in insertion order. The
//   caller-facing identity of an edge is its EdgeRef (u, v, key), where key
//   distinguishes parallel edges between the same ordered pair.
//
// Structure is append-only: nodes and edges are never removed, so indices
// stay valid for the lifetime of the graph. Algorithms only read structure
// and add or overwrite named edge attributes.
class MultiDiGraph {
public:
  struct Edge {
    NodeIndex src {-1};
    NodeIndex dst {-1};
    EdgeKey key {0};
    AttributeMap attrs {};
  };

  // Adds a node if absent; returns its dense index either way.
  NodeIndex add_node(NodeId id);

  // Adds an edge u->v (creating missing endpoints) with the lowest unused
  // key for that pair and returns the key.
  EdgeKey add_edge(NodeId u, NodeId v, AttributeMap attrs = {});

  // Adds an edge with an explicit key. Throws std::invalid_argument if the
  // key is already used for (u, v).
  EdgeKey add_edge(NodeId u, NodeId v, EdgeKey key, AttributeMap attrs);

  [[nodiscard]] std::int32_t num_nodes() const noexcept { return static_cast<std::int32_t>(node_ids_.size()); }
  [[nodiscard]] std::int32_t num_edges() const noexcept { return static_cast<std::int32_t>(edges_.size()); }

  [[nodiscard]] bool has_node(NodeId id) const noexcept { return index_.find(id) != index_.end(); }
  [[nodiscard]] std::optional<NodeIndex> find_node(NodeId id) const noexcept;
  // Throws NodeNotFound for an unknown id.
  [[nodiscard]] NodeIndex node_index(NodeId id) const;
  [[nodiscard]] NodeId node_id(NodeIndex i) const noexcept { return node_ids_[static_cast<std::size_t>(i)]; }
  [[nodiscard]] std::span<const NodeId> node_ids_view() const noexcept { return node_ids_; }

  [[nodiscard]] const Edge& edge(EdgeIndex e) const noexcept { return edges_[static_cast<std::size_t>(e)]; }
  [[nodiscard]] std::span<const Edge> edges_view() const noexcept { return edges_; }
  [[nodiscard]] EdgeRef edge_ref(EdgeIndex e) const noexcept;

  // Outgoing edges of a node in insertion order.
  [[nodiscard]] std::span<const EdgeIndex> out_edges(NodeIndex u) const noexcept {
    return out_[static_cast<std::size_t>(u)];
  }

  // All parallel edges u->v in key insertion order; empty if none or if
  // either node is unknown.
  [[nodiscard]] std::vector<EdgeIndex> edges_between(NodeId u, NodeId v) const;
  [[nodiscard]] std::optional<EdgeIndex> find_edge(NodeId u, NodeId v, EdgeKey key) const;

  // Attribute access; nullptr when the edge has no such attribute.
  [[nodiscard]] const AttrValue* edge_attribute(EdgeIndex e, std::string_view name) const noexcept;
  // Adds or overwrites one attribute. Throws std::out_of_range for a bad index.
  void set_edge_attribute(EdgeIndex e, std::string_view name, AttrValue value);

private:
  std::vector<NodeId> node_ids_ {};
  std::unordered_map<NodeId, NodeIndex> index_ {};
  std::vector<Edge> edges_ {};
  std::vector<std::vector<EdgeIndex>> out_ {};
};

} // namespace roadnet::core
