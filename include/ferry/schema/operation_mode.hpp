#pragma once

#include <ferry/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: operation mode.
// Bridge workflow: per (chain, token) policy deciding whether bridged value is
// destroyed/created or held/released from custody.
namespace ferry::schema {

enum class operation_mode_t : uint8_t {
  unsupported = 0,
  burn_or_mint = 1,
  lock_or_transfer = 2
};

inline constexpr auto kOperationModeMappings = std::array{
    enum_mapping_t<operation_mode_t>{
        "unsupported", operation_mode_t::unsupported},
    enum_mapping_t<operation_mode_t>{
        "burn_or_mint", operation_mode_t::burn_or_mint},
    enum_mapping_t<operation_mode_t>{
        "lock_or_transfer", operation_mode_t::lock_or_transfer}};

template <>
inline std::optional<operation_mode_t> try_from_string<operation_mode_t>(
    const std::string_view value) {
  return value_of(value, kOperationModeMappings);
}

inline constexpr std::string_view to_string(const operation_mode_t value) {
  return name_of(value, kOperationModeMappings);
}

}  // namespace ferry::schema
