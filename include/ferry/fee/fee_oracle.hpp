#pragma once

#include <ferry/schema/primitives.hpp>

namespace ferry::fee {

/// Source of the relocation fee charged on top of the principal.
class fee_oracle {
 public:
  virtual ~fee_oracle() = default;

  virtual ferry::schema::amount_t define_fee(
      ferry::schema::chain_id_t chain_id,
      const ferry::schema::asset_id_t& token,
      const ferry::schema::account_id_t& account,
      const ferry::schema::amount_t& amount) const = 0;

  /// Identity reported in configuration events.
  virtual ferry::schema::account_id_t id() const = 0;
};

}  // namespace ferry::fee
