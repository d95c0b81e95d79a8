#pragma once

#include <ferry/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace ferry::schema {

template <uint16_t Version>
struct ledger_info;

template <>
struct ledger_info<1> final {
  uint16_t schema_version{1};
  std::string data{"ferry-ledger"};
  std::string version{"0.1.0"};
  uint64_t height{};
  hash32_t state_root{};
};

using ledger_info_t = ledger_info<1>;

}  // namespace ferry::schema
