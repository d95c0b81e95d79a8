#pragma once
#include <ferry/schema/primitives.hpp>
#include <ferry/schema/relocation_status.hpp>

// Schema type: relocation.
// Bridge workflow: outgoing request keyed by (chain_id, nonce). old_nonce and
// new_nonce link the two halves of a postpone/continue pair and stay zero
// otherwise.
namespace ferry::schema {

template <uint16_t Version>
struct relocation;

template <>
struct relocation<1> final {
  uint16_t version{1};
  asset_id_t token{};
  account_id_t account{};
  amount_t amount{};
  relocation_status_t status{relocation_status_t::nonexistent};
  amount_t fee{};
  nonce_t old_nonce{};
  nonce_t new_nonce{};
};

using relocation_t = relocation<1>;

}  // namespace ferry::schema
