#include "roadnet/core/attribute.hpp"

#include <charconv>
#include <cmath>
#include <sstream>

#include "roadnet/core/error.hpp"

namespace roadnet::core {

bool is_null(const AttrValue& v) noexcept {
  if (std::holds_alternative<Null>(v)) return true;
  if (const auto* d = std::get_if<double>(&v)) return std::isnan(*d);
  return false;
}

std::optional<double> parse_number(std::string_view s) noexcept {
  auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };
  while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return std::nullopt;
  double out = 0.0;
  const char* first = s.data();
  const char* last = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  if (ec != std::errc{} || ptr != last) return std::nullopt;
  return out;
}

std::optional<double> to_number(const AttrValue& v, std::string_view attr) {
  return std::visit(overloaded{
      [](const Null&) -> std::optional<double> { return std::nullopt; },
      [](double d) -> std::optional<double> {
        if (std::isnan(d)) return std::nullopt;
        return d;
      },
      [&](const Text& t) -> std::optional<double> {
        auto parsed = parse_number(t);
        if (!parsed) {
          throw InvalidAttributeType("The edge attribute '" + std::string(attr) +
                                     "' contains non-numeric values: " + describe(v));
        }
        if (std::isnan(*parsed)) return std::nullopt;
        return parsed;
      },
      [&](const TextList&) -> std::optional<double> {
        throw InvalidAttributeType("The edge attribute '" + std::string(attr) +
                                   "' contains non-numeric values: " + describe(v));
      },
  }, v);
}

std::string describe(const AttrValue& v) {
  return std::visit(overloaded{
      [](const Null&) -> std::string { return "null"; },
      [](double d) -> std::string {
        std::ostringstream os;
        os << d;
        return os.str();
      },
      [](const Text& t) -> std::string { return "'" + t + "'"; },
      [](const TextList& l) -> std::string {
        std::string out = "[";
        for (std::size_t i = 0; i < l.size(); ++i) {
          if (i) out += ", ";
          out += "'" + l[i] + "'";
        }
        return out + "]";
      },
  }, v);
}

} // namespace roadnet::core
