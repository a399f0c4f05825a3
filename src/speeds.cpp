/*
  Speed imputation.

  Raw `maxspeed` values are normalized to km/h per edge, edges are grouped by
  `highway` classification, and each group gets a default speed that fills
  the edges without an observed value. Everything is computed before the
  graph is touched, so a failure leaves it unchanged.
*/
#include "roadnet/core/speeds.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <map>
#include <string>
#include <vector>

#include "roadnet/core/constants.hpp"
#include "roadnet/core/error.hpp"
#include "roadnet/core/log.hpp"

namespace roadnet::core {

namespace {

bool iequals(std::string_view a, std::string_view b) noexcept {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
         });
}

// Conversion factor to km/h for a unit suffix; 0 for an unknown unit.
double unit_factor(std::string_view unit, bool convert_units) noexcept {
  if (unit.empty() || iequals(unit, "km/h") || iequals(unit, "kmh") || iequals(unit, "kph")) return 1.0;
  if (iequals(unit, "mph")) return convert_units ? kMilesToKm : 1.0;
  if (iequals(unit, "knots")) return convert_units ? kKnotsToKm : 1.0;
  return 0.0;
}

// One speed value: <digits>[(.|,)<digits>][ ]<unit>?
std::optional<double> parse_speed_value(std::string_view s, bool convert_units) {
  std::size_t i = 0;
  auto is_digit = [&](std::size_t p) { return p < s.size() && std::isdigit(static_cast<unsigned char>(s[p])); };
  if (!is_digit(0)) return std::nullopt;
  std::string number;
  while (is_digit(i)) number.push_back(s[i++]);
  if (i < s.size() && (s[i] == '.' || s[i] == ',')) {
    if (!is_digit(i + 1)) return std::nullopt;
    number.push_back('.');
    ++i;
    while (is_digit(i)) number.push_back(s[i++]);
  }
  std::string_view unit = s.substr(i);
  if (!unit.empty() && unit.front() == ' ') {
    unit.remove_prefix(1);
    if (unit.empty()) return std::nullopt;
  }
  const double factor = unit_factor(unit, convert_units);
  if (factor == 0.0) return std::nullopt;
  double value = 0.0;
  auto [ptr, ec] = std::from_chars(number.data(), number.data() + number.size(), value);
  if (ec != std::errc{} || ptr != number.data() + number.size()) return std::nullopt;
  return value * factor;
}

std::optional<double> aggregate(const Aggregator& agg, const std::vector<double>& values) {
  if (values.empty()) return std::nullopt;
  const double out = agg(std::span<const double>(values));
  if (!std::isfinite(out)) return std::nullopt;
  return out;
}

std::string label(const std::optional<std::string>& cls) {
  return cls ? *cls : std::string("<unclassified>");
}

} // namespace

std::optional<double> clean_maxspeed(std::string_view raw, const Aggregator& agg, bool convert_units) {
  std::vector<double> values;
  std::size_t start = 0;
  for (;;) {
    const auto bar = raw.find('|', start);
    auto piece = raw.substr(start, bar == std::string_view::npos ? std::string_view::npos : bar - start);
    auto v = parse_speed_value(piece, convert_units);
    if (!v) return std::nullopt;
    values.push_back(*v);
    if (bar == std::string_view::npos) break;
    start = bar + 1;
  }
  return aggregate(agg, values);
}

std::optional<double> collapse_maxspeed_values(const AttrValue& value, const Aggregator& agg, bool convert_units) {
  return std::visit(overloaded{
      [](const Null&) -> std::optional<double> { return std::nullopt; },
      [](double d) -> std::optional<double> {
        if (!std::isfinite(d)) return std::nullopt;
        return d;
      },
      [&](const Text& t) { return clean_maxspeed(t, agg, convert_units); },
      [&](const TextList& list) -> std::optional<double> {
        // Each element keeps its own unit; only usable values are aggregated.
        std::vector<double> values;
        for (const auto& item : list) {
          if (auto v = clean_maxspeed(item, agg, convert_units)) values.push_back(*v);
        }
        return aggregate(agg, values);
      },
  }, value);
}

std::optional<std::string> edge_classification(const AttrValue* value) {
  if (!value || is_null(*value)) return std::nullopt;
  return std::visit(overloaded{
      [](const Null&) -> std::optional<std::string> { return std::nullopt; },
      [&](double) -> std::optional<std::string> { return describe(*value); },
      [](const Text& t) -> std::optional<std::string> { return t; },
      [](const TextList& list) -> std::optional<std::string> {
        if (list.empty()) return std::nullopt;
        return list.front();
      },
  }, *value);
}

void add_edge_speeds(MultiDiGraph& g, const SpeedOptions& opts) {
  const auto m = static_cast<std::size_t>(g.num_edges());
  if (m == 0) {
    logger()->debug("add_edge_speeds: graph has no edges");
    return;
  }

  // Normalized observed speed and classification per edge
  std::vector<std::optional<double>> speed(m);
  std::vector<std::optional<std::string>> cls(m);
  std::map<std::optional<std::string>, std::vector<double>> observed;
  for (std::size_t i = 0; i < m; ++i) {
    const auto e = static_cast<EdgeIndex>(i);
    if (const AttrValue* raw = g.edge_attribute(e, kMaxSpeedAttr)) {
      speed[i] = collapse_maxspeed_values(*raw, opts.agg, opts.convert_units);
    }
    cls[i] = edge_classification(g.edge_attribute(e, kHighwayAttr));
    auto& bucket = observed[cls[i]];
    if (speed[i]) bucket.push_back(*speed[i]);
  }

  // Per-class defaults: caller override, else aggregate of observed values
  std::map<std::optional<std::string>, std::optional<double>> defaults;
  std::vector<double> defined;
  for (const auto& [hwy, speed_kph] : opts.hwy_speeds) {
    if (std::isfinite(speed_kph)) defined.push_back(speed_kph);
  }
  for (const auto& [c, values] : observed) {
    if (c) {
      auto it = opts.hwy_speeds.find(*c);
      if (it != opts.hwy_speeds.end() && std::isfinite(it->second)) {
        defaults[c] = it->second;
        continue;
      }
    }
    defaults[c] = aggregate(opts.agg, values);
    if (defaults[c]) defined.push_back(*defaults[c]);
  }

  // Classes still undefined: fallback, else aggregate over all class defaults
  std::optional<double> fill;
  if (opts.fallback && std::isfinite(*opts.fallback)) {
    fill = opts.fallback;
  } else {
    fill = aggregate(opts.agg, defined);
  }
  for (auto& [c, d] : defaults) {
    if (!d) d = fill;
    if (d) logger()->debug("add_edge_speeds: {} -> {} km/h", label(c), *d);
  }

  std::size_t unresolved = 0;
  for (std::size_t i = 0; i < m; ++i) {
    if (!speed[i]) speed[i] = defaults[cls[i]];
    if (!speed[i]) ++unresolved;
  }
  if (unresolved == m) {
    throw UnresolvableSpeedData(
        "This graph's edges have no preexisting 'maxspeed' attribute values so you "
        "must pass hwy_speeds or fallback arguments.");
  }
  if (unresolved > 0) {
    throw UnresolvableSpeedData("could not resolve a speed for " + std::to_string(unresolved) +
                                " of " + std::to_string(m) + " edges");
  }

  for (std::size_t i = 0; i < m; ++i) {
    g.set_edge_attribute(static_cast<EdgeIndex>(i), kSpeedAttr, *speed[i]);
  }
}

} // namespace roadnet::core
