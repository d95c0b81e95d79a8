#pragma once
#include <ferry/schema/operation_mode.hpp>
#include <ferry/schema/primitives.hpp>

namespace ferry::schema {

template <uint16_t Version>
struct token_modes;

template <>
struct token_modes<1> final {
  uint16_t version{1};
  operation_mode_t relocation_mode{operation_mode_t::unsupported};
  operation_mode_t accommodation_mode{operation_mode_t::unsupported};
};

using token_modes_t = token_modes<1>;

}  // namespace ferry::schema
