#pragma once

#include <ferry/schema/primitives.hpp>
#include <ferry/storage/transaction.hpp>

namespace ferry::token {

/// Token transfer, burn and mint primitive driven by the ledger.
///
/// Every call reports success; a refused call leaves balances untouched.
/// The gateway joins the ledger's unit of work, so changes made during a
/// failed operation are rolled back with it.
class token_gateway : public ferry::storage::participant {
 public:
  ~token_gateway() override = default;

  /// Pull `amount` of `token` from `from` into `to` (typically custody).
  virtual bool transfer_in(const ferry::schema::asset_id_t& token,
                           const ferry::schema::account_id_t& from,
                           const ferry::schema::account_id_t& to,
                           const ferry::schema::amount_t& amount) = 0;

  /// Pay `amount` of `token` out of `from` (typically custody) to `to`.
  virtual bool transfer_out(const ferry::schema::asset_id_t& token,
                            const ferry::schema::account_id_t& from,
                            const ferry::schema::account_id_t& to,
                            const ferry::schema::amount_t& amount) = 0;

  virtual bool burn(const ferry::schema::asset_id_t& token,
                    const ferry::schema::account_id_t& from,
                    const ferry::schema::amount_t& amount) = 0;

  virtual bool mint(const ferry::schema::asset_id_t& token,
                    const ferry::schema::account_id_t& to,
                    const ferry::schema::amount_t& amount) = 0;

  /// True when `token` may be burned and minted by the ledger.
  virtual bool supports_bridge(const ferry::schema::asset_id_t& token) = 0;
};

}  // namespace ferry::token
