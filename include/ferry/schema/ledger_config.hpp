#pragma once
#include <ferry/schema/primitives.hpp>

namespace ferry::schema {

template <uint16_t Version>
struct ledger_config;

template <>
struct ledger_config<1> final {
  uint16_t version{1};
  account_id_t fee_collector{};
};

using ledger_config_t = ledger_config<1>;

}  // namespace ferry::schema
