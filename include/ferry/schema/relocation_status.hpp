#pragma once

#include <ferry/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: relocation status.
// Bridge workflow: outgoing request lifecycle. Every status other than
// pending and postponed is terminal for its nonce.
namespace ferry::schema {

enum class relocation_status_t : uint8_t {
  nonexistent = 0,
  pending = 1,
  canceled = 2,
  processed = 3,
  rejected = 4,
  aborted = 5,
  postponed = 6,
  continued = 7
};

inline constexpr auto kRelocationStatusMappings = std::array{
    enum_mapping_t<relocation_status_t>{
        "nonexistent", relocation_status_t::nonexistent},
    enum_mapping_t<relocation_status_t>{
        "pending", relocation_status_t::pending},
    enum_mapping_t<relocation_status_t>{
        "canceled", relocation_status_t::canceled},
    enum_mapping_t<relocation_status_t>{
        "processed", relocation_status_t::processed},
    enum_mapping_t<relocation_status_t>{
        "rejected", relocation_status_t::rejected},
    enum_mapping_t<relocation_status_t>{
        "aborted", relocation_status_t::aborted},
    enum_mapping_t<relocation_status_t>{
        "postponed", relocation_status_t::postponed},
    enum_mapping_t<relocation_status_t>{
        "continued", relocation_status_t::continued}};

template <>
inline std::optional<relocation_status_t> try_from_string<relocation_status_t>(
    const std::string_view value) {
  return value_of(value, kRelocationStatusMappings);
}

inline constexpr std::string_view to_string(const relocation_status_t value) {
  return name_of(value, kRelocationStatusMappings);
}

/// True for statuses from which cancel, reject and abort are allowed.
inline constexpr bool is_refusable(const relocation_status_t value) {
  return value == relocation_status_t::pending ||
         value == relocation_status_t::postponed;
}

}  // namespace ferry::schema
