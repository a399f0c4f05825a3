/*
  Edge attribute values.

  Attributes arrive from the graph-building collaborators loosely typed: a
  value is null, a number, a string, or a list of strings (several source
  records collapsed onto one edge). AttrValue is the tagged union of those
  shapes; helpers below convert it to numbers with explicit null handling.
*/
#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace roadnet::core {

struct Null {
  friend bool operator==(const Null&, const Null&) noexcept { return true; }
};

using Text = std::string;
using TextList = std::vector<std::string>;
using AttrValue = std::variant<Null, double, Text, TextList>;

// Ordered map with heterogeneous lookup (find by std::string_view).
using AttributeMap = std::map<std::string, AttrValue, std::less<>>;

// Helper for exhaustive std::visit over AttrValue alternatives.
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// True for Null and for NaN numbers.
[[nodiscard]] bool is_null(const AttrValue& v) noexcept;

// Parse a whole string (surrounding whitespace allowed) as a real number.
[[nodiscard]] std::optional<double> parse_number(std::string_view s) noexcept;

// Numeric view of an attribute value. Returns nullopt when the value is null
// (Null or NaN). Throws InvalidAttributeType when the value is present but
// not numeric (text that does not parse, or a list); `attr` names the
// attribute in the message.
[[nodiscard]] std::optional<double> to_number(const AttrValue& v, std::string_view attr);

// Short human-readable rendering used in log and error messages.
[[nodiscard]] std::string describe(const AttrValue& v);

} // namespace roadnet::core
