#pragma once

#include <ferry/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: role id.
// Bridge workflow: operator responsibilities. Owners configure, pausers halt
// mutating entry points, bridgers relay batches and settle relocations.
namespace ferry::schema {

enum class role_id_t : uint8_t { owner = 0, pauser = 1, bridger = 2 };

inline constexpr auto kRoleIdMappings = std::array{
    enum_mapping_t<role_id_t>{"owner", role_id_t::owner},
    enum_mapping_t<role_id_t>{"pauser", role_id_t::pauser},
    enum_mapping_t<role_id_t>{"bridger", role_id_t::bridger},
};

template <>
inline std::optional<role_id_t> try_from_string<role_id_t>(
    const std::string_view value) {
  return value_of(value, kRoleIdMappings);
}

inline constexpr std::string_view to_string(const role_id_t value) {
  return name_of(value, kRoleIdMappings);
}

}  // namespace ferry::schema
