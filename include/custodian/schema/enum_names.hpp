#pragma once

#include <optional>
#include <string_view>

namespace custodian::schema {

/// Name table for an enum. Specializations provide
/// `static constexpr auto values`, an array of (name, enumerator) pairs.
template <typename Enum>
struct enum_names;

template <typename Enum>
constexpr std::optional<Enum> try_parse_enum(const std::string_view name) {
  for (const auto& [candidate, value] : enum_names<Enum>::values) {
    if (candidate == name) {
      return value;
    }
  }
  return std::nullopt;
}

template <typename Enum>
constexpr std::string_view enum_name(const Enum value) {
  for (const auto& [candidate, enumerator] : enum_names<Enum>::values) {
    if (enumerator == value) {
      return candidate;
    }
  }
  return "unknown";
}

}  // namespace custodian::schema
