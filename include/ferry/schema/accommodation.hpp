#pragma once
#include <ferry/schema/primitives.hpp>
#include <ferry/schema/relocation_status.hpp>

// Schema type: accommodation.
// Bridge workflow: one relayed entry describing a source-side relocation and
// the terminal status it reached there. Supplied per call, never stored.
namespace ferry::schema {

template <uint16_t Version>
struct accommodation;

template <>
struct accommodation<1> final {
  uint16_t version{1};
  asset_id_t token{};
  account_id_t account{};
  amount_t amount{};
  relocation_status_t status{relocation_status_t::nonexistent};
};

using accommodation_t = accommodation<1>;

}  // namespace ferry::schema
