/* Checks on edge attributes used as numeric inputs. */
#pragma once

#include <optional>
#include <string_view>

#include "roadnet/core/multidigraph.hpp"
#include "roadnet/core/types.hpp"

namespace roadnet::core {

// Verify that every present value of `attr` converts to a finite,
// non-negative number. Throws InvalidAttributeType otherwise. Edges where the
// attribute is missing or null are not an error; a warning is logged because
// weighted searches will skip them.
void verify_edge_attribute(const MultiDiGraph& g, std::string_view attr);

// Weight of one edge under `attr`: nullopt when missing or null. Throws
// InvalidAttributeType for non-numeric, negative or infinite values.
[[nodiscard]] std::optional<Weight> edge_weight(const MultiDiGraph& g, EdgeIndex e,
                                                std::string_view attr);

} // namespace roadnet::core
