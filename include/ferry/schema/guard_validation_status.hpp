#pragma once

#include <ferry/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: guard validation status.
// Bridge workflow: verdict of the accommodation guard for one credit.
namespace ferry::schema {

enum class guard_validation_status_t : uint8_t {
  no_error = 0,
  time_frame_not_set = 1,
  volume_limit_reached = 2
};

inline constexpr auto kGuardValidationStatusMappings = std::array{
    enum_mapping_t<guard_validation_status_t>{
        "no_error", guard_validation_status_t::no_error},
    enum_mapping_t<guard_validation_status_t>{
        "time_frame_not_set", guard_validation_status_t::time_frame_not_set},
    enum_mapping_t<guard_validation_status_t>{
        "volume_limit_reached",
        guard_validation_status_t::volume_limit_reached}};

template <>
inline std::optional<guard_validation_status_t>
try_from_string<guard_validation_status_t>(const std::string_view value) {
  return value_of(value, kGuardValidationStatusMappings);
}

inline constexpr std::string_view to_string(
    const guard_validation_status_t value) {
  return name_of(value, kGuardValidationStatusMappings);
}

}  // namespace ferry::schema
