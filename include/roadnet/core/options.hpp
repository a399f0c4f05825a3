/* Call-site configuration for routing and speed imputation. */
#pragma once

#include <functional>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>

#include "roadnet/core/constants.hpp"

namespace roadnet::core {

// Reduction over observed speeds. Called with a non-empty sequence; a
// non-finite result is treated as "no value".
using Aggregator = std::function<double(std::span<const double>)>;

[[nodiscard]] double mean(std::span<const double> values);
[[nodiscard]] double median(std::span<const double> values);

// Classification label -> speed in km/h.
using SpeedTable = std::unordered_map<std::string, double>;

struct RoutingOptions {
  // Edge attribute minimized by the search.
  std::string weight { kLengthAttr };
  // Worker count for batch solving; std::nullopt uses every hardware thread.
  // Capped at the available hardware parallelism.
  std::optional<int> cpus { 1 };
};

struct SpeedOptions {
  // Speeds to impute for edges of these classifications that lack one.
  SpeedTable hwy_speeds {};
  // Speed for classifications with no override and no observed values.
  std::optional<double> fallback {};
  Aggregator agg { mean };
  // Convert values tagged mph or knots to km/h.
  bool convert_units { true };
};

} // namespace roadnet::core
