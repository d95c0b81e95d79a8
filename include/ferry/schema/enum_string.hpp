#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

namespace ferry::schema {

template <typename Enum>
using enum_mapping_t = std::pair<std::string_view, Enum>;

/// Wire name of `value`; "unknown" when the table has no entry for it.
template <typename Enum, std::size_t N>
constexpr std::string_view name_of(
    const Enum value,
    const std::array<enum_mapping_t<Enum>, N>& mappings) {
  for (const auto& [name, mapped] : mappings) {
    if (mapped == value) {
      return name;
    }
  }
  return "unknown";
}

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> value_of(
    const std::string_view name,
    const std::array<enum_mapping_t<Enum>, N>& mappings) {
  for (const auto& [candidate, mapped] : mappings) {
    if (candidate == name) {
      return mapped;
    }
  }
  return std::nullopt;
}

/// Parse a wire name; specialized next to every schema enum.
template <typename Enum>
std::optional<Enum> try_from_string(std::string_view value);

}  // namespace ferry::schema
