/* Core type aliases and helper structs.
 *
 * - NodeId: external node identifier (OSM ids are unsigned 64-bit)
 * - NodeIndex/EdgeIndex: dense int32 positions inside a MultiDiGraph
 * - Weight: path weight (double; lengths, seconds, ...)
 * - PathResult: Path when a route exists, NotFound otherwise
 */
#pragma once

#include <cstdint>
#include <functional>
#include <variant>
#include <vector>

namespace roadnet::core {

using NodeId    = std::uint64_t;
using EdgeKey   = std::uint32_t;  // Parallel index among edges sharing (u, v)
using NodeIndex = std::int32_t;
using EdgeIndex = std::int32_t;
using Weight    = double;

// Ordered node sequence; a single node means origin == destination.
using Path = std::vector<NodeId>;

// Marker for an unreachable destination. Not an error.
struct NotFound {
  friend bool operator==(const NotFound&, const NotFound&) noexcept { return true; }
};

using PathResult = std::variant<Path, NotFound>;

[[nodiscard]] inline bool is_found(const PathResult& r) noexcept {
  return std::holds_alternative<Path>(r);
}

// EdgeRef identifies one concrete edge of a multigraph: (u, v, key).
struct EdgeRef {
  NodeId u {0};
  NodeId v {0};
  EdgeKey key {0};
  friend bool operator==(const EdgeRef& a, const EdgeRef& b) noexcept {
    return a.u == b.u && a.v == b.v && a.key == b.key;
  }
};

struct EdgeRefHash {
  std::size_t operator()(const EdgeRef& k) const noexcept {
    std::size_t h = 0;
    auto combine = [&h](std::size_t v) {
      h ^= v + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    };
    combine(std::hash<NodeId>{}(k.u));
    combine(std::hash<NodeId>{}(k.v));
    combine(std::hash<EdgeKey>{}(k.key));
    return h;
  }
};

} // namespace roadnet::core
