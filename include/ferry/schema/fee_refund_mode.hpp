#pragma once

#include <ferry/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: fee refund mode.
// Bridge workflow: whether a withheld fee goes back to the initiator when a
// relocation is canceled or rejected.
namespace ferry::schema {

enum class fee_refund_mode_t : uint8_t { nothing = 0, full = 1 };

inline constexpr auto kFeeRefundModeMappings = std::array{
    enum_mapping_t<fee_refund_mode_t>{"nothing",
                                                   fee_refund_mode_t::nothing},
    enum_mapping_t<fee_refund_mode_t>{"full",
                                                   fee_refund_mode_t::full}};

template <>
inline std::optional<fee_refund_mode_t> try_from_string<fee_refund_mode_t>(
    const std::string_view value) {
  return value_of(value, kFeeRefundModeMappings);
}

inline constexpr std::string_view to_string(const fee_refund_mode_t value) {
  return name_of(value, kFeeRefundModeMappings);
}

}  // namespace ferry::schema
