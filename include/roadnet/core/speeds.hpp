/*
  Edge speed imputation.

  add_edge_speeds() gives every edge a `speed_kph` attribute. Observed speed
  limits come from the raw `maxspeed` attribute; edges without one receive a
  per-classification (`highway`) default: caller override, else the
  aggregate of observed speeds in that class, else the caller fallback, else
  the aggregate over all class defaults.
*/
#pragma once

#include <optional>
#include <string_view>

#include "roadnet/core/attribute.hpp"
#include "roadnet/core/multidigraph.hpp"
#include "roadnet/core/options.hpp"

namespace roadnet::core {

// Clean one raw speed string, in km/h. Per-lane values separated by '|' are
// parsed independently and reduced with `agg`. Each value must read
// "<number>[ ]<unit>" with unit km/h, kmh, kph, mph or knots (any case), or
// a bare number (km/h); a decimal comma is accepted. Returns nullopt if any
// piece does not parse.
[[nodiscard]] std::optional<double> clean_maxspeed(std::string_view raw, const Aggregator& agg,
                                                   bool convert_units = true);

// Reduce a raw `maxspeed` attribute value to one km/h number: text is
// cleaned, lists have each element cleaned independently and the usable
// results aggregated, numbers pass through, null yields nullopt.
[[nodiscard]] std::optional<double> collapse_maxspeed_values(const AttrValue& value, const Aggregator& agg,
                                                             bool convert_units = true);

// Classification label of an edge: text as-is, first element of a list,
// nullopt for null or missing.
[[nodiscard]] std::optional<std::string> edge_classification(const AttrValue* value);

// Throws UnresolvableSpeedData (leaving the graph unchanged) when no edge
// ends up with a speed.
void add_edge_speeds(MultiDiGraph& g, const SpeedOptions& opts = {});

} // namespace roadnet::core
