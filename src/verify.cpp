#include "roadnet/core/verify.hpp"

#include <cmath>
#include <string>

#include "roadnet/core/error.hpp"
#include "roadnet/core/log.hpp"

namespace roadnet::core {

std::optional<Weight> edge_weight(const MultiDiGraph& g, EdgeIndex e, std::string_view attr) {
  const AttrValue* value = g.edge_attribute(e, attr);
  if (!value) return std::nullopt;
  auto w = to_number(*value, attr);
  if (!w) return std::nullopt;
  if (!std::isfinite(*w) || *w < 0.0) {
    throw InvalidAttributeType("The edge attribute '" + std::string(attr) +
                               "' must be finite and non-negative, got " + describe(*value));
  }
  return w;
}

void verify_edge_attribute(const MultiDiGraph& g, std::string_view attr) {
  std::int32_t missing = 0;
  for (EdgeIndex e = 0; e < g.num_edges(); ++e) {
    if (!edge_weight(g, e, attr)) ++missing;
  }
  if (missing > 0) {
    logger()->warn("The attribute '{}' is missing or null on {} of {} edges.",
                   attr, missing, g.num_edges());
  }
}

} // namespace roadnet::core
