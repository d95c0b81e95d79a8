#pragma once
#include <ferry/schema/primitives.hpp>

namespace ferry::schema {

template <uint16_t Version>
struct chain_counters;

template <>
struct chain_counters<1> final {
  uint16_t version{1};
  uint64_t pending_relocation_count{};
  nonce_t last_processed_relocation_nonce{};
  nonce_t last_accommodation_nonce{};
};

using chain_counters_t = chain_counters<1>;

}  // namespace ferry::schema
