/* Yen's k shortest loopless paths, generated lazily. */
#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <queue>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "roadnet/core/compact_graph.hpp"
#include "roadnet/core/constants.hpp"
#include "roadnet/core/multidigraph.hpp"
#include "roadnet/core/shortest_paths.hpp"
#include "roadnet/core/types.hpp"

namespace roadnet::core {

// KShortestPaths yields up to k simple paths from orig to dest in
// non-decreasing total weight. It ranks paths over a snapshot that keeps only
// the minimum-weight edge of each ordered node pair. Equal-weight candidates
// come out in the order they were discovered.
//
// The generator is single-pass: each next() computes only what is needed for
// the following path. It holds its own snapshot and does not reference the
// source graph after construction.
class KShortestPaths {
public:
  KShortestPaths(const MultiDiGraph& g, NodeId orig, NodeId dest, int k,
                 std::string_view weight = kLengthAttr);

  // Next path, or nullopt once k paths were produced or none remain.
  [[nodiscard]] std::optional<Path> next();

  // Total weight of the path most recently returned by next().
  [[nodiscard]] Weight last_weight() const noexcept { return last_weight_; }
  [[nodiscard]] std::size_t produced() const noexcept { return accepted_.size(); }

  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Path;
    using difference_type = std::ptrdiff_t;
    using pointer = const Path*;
    using reference = const Path&;

    iterator() = default;
    explicit iterator(KShortestPaths* gen) : gen_(gen) { advance(); }

    reference operator*() const { return *current_; }
    pointer operator->() const { return &*current_; }
    iterator& operator++() { advance(); return *this; }
    void operator++(int) { advance(); }
    friend bool operator==(const iterator& a, const iterator& b) noexcept {
      return a.done() == b.done();
    }

  private:
    void advance() {
      current_ = gen_ ? gen_->next() : std::nullopt;
      if (!current_) gen_ = nullptr;
    }
    [[nodiscard]] bool done() const noexcept { return gen_ == nullptr; }

    KShortestPaths* gen_ {nullptr};
    std::optional<Path> current_ {};
  };

  // Input range over the remaining paths; begin() starts consuming.
  [[nodiscard]] iterator begin() { return iterator(this); }
  [[nodiscard]] iterator end() { return iterator(); }

private:
  struct Candidate {
    Weight cost {0.0};
    std::uint64_t seq {0};  // discovery order for deterministic ties
    IndexPath path;
  };
  struct NodeSeqHash {
    std::size_t operator()(const std::vector<NodeIndex>& v) const noexcept {
      std::size_t h = 1469598103934665603ull;
      for (auto x : v) { h ^= static_cast<std::size_t>(x) + 0x9e3779b97f4a7c15ull; h *= 1099511628211ull; }
      return h;
    }
  };
  struct CandidateAfter {
    bool operator()(const Candidate& a, const Candidate& b) const noexcept {
      if (a.cost != b.cost) return a.cost > b.cost;
      return a.seq > b.seq;
    }
  };

  void push_spur_candidates(const IndexPath& last);
  [[nodiscard]] Path to_path(const IndexPath& p) const;

  CompactGraph graph_;
  std::vector<NodeId> node_ids_;
  NodeIndex src_ {-1};
  NodeIndex dst_ {-1};
  std::size_t k_ {0};
  bool started_ {false};
  bool exhausted_ {false};
  Weight last_weight_ {0.0};
  std::uint64_t next_seq_ {0};

  std::vector<IndexPath> accepted_ {};
  std::priority_queue<Candidate, std::vector<Candidate>, CandidateAfter> candidates_ {};
  std::unordered_set<std::vector<NodeIndex>, NodeSeqHash> seen_ {};  // node sequences already accepted or queued
};

// Convenience: construct the generator. Throws NodeNotFound for unknown
// nodes and std::invalid_argument for k < 0.
[[nodiscard]] KShortestPaths k_shortest_paths(const MultiDiGraph& g, NodeId orig, NodeId dest,
                                              int k, std::string_view weight = kLengthAttr);

} // namespace roadnet::core
