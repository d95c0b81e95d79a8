#pragma once

#include <ferry/common/undo_log.hpp>
#include <ferry/token/token_gateway.hpp>
#include <map>
#include <mutex>
#include <set>
#include <utility>

namespace ferry::token {

/// In-memory multi-asset balance book.
///
/// Balances are keyed by (asset, account). Only assets flagged bridgeable
/// accept `burn` and `mint`. The book holds no durable rows; it is the
/// reference gateway for tests and the inspector.
class token_book : public token_gateway {
 public:
  token_book() = default;

  bool transfer_in(const ferry::schema::asset_id_t& token,
                   const ferry::schema::account_id_t& from,
                   const ferry::schema::account_id_t& to,
                   const ferry::schema::amount_t& amount) override;
  bool transfer_out(const ferry::schema::asset_id_t& token,
                    const ferry::schema::account_id_t& from,
                    const ferry::schema::account_id_t& to,
                    const ferry::schema::amount_t& amount) override;
  bool burn(const ferry::schema::asset_id_t& token,
            const ferry::schema::account_id_t& from,
            const ferry::schema::amount_t& amount) override;
  bool mint(const ferry::schema::asset_id_t& token,
            const ferry::schema::account_id_t& to,
            const ferry::schema::amount_t& amount) override;
  bool supports_bridge(const ferry::schema::asset_id_t& token) override;

  void begin() override;
  void commit(std::vector<ferry::storage::key_write_t>& writes) override;
  void rollback() override;

  /// Issue `amount` outside of any ledger operation (funding, fixtures).
  /// Returns false when the token supply would overflow.
  bool credit(const ferry::schema::asset_id_t& token,
              const ferry::schema::account_id_t& account,
              const ferry::schema::amount_t& amount);
  void set_bridgeable(const ferry::schema::asset_id_t& token, bool bridgeable);

  ferry::schema::amount_t balance_of(
      const ferry::schema::asset_id_t& token,
      const ferry::schema::account_id_t& account) const;
  ferry::schema::amount_t total_supply(
      const ferry::schema::asset_id_t& token) const;

 private:
  using balance_key_t =
      std::pair<ferry::schema::asset_id_t, ferry::schema::account_id_t>;

  bool move(const ferry::schema::asset_id_t& token,
            const ferry::schema::account_id_t& from,
            const ferry::schema::account_id_t& to,
            const ferry::schema::amount_t& amount);
  ferry::schema::amount_t supply_of(
      const ferry::schema::asset_id_t& token) const;

  mutable std::recursive_mutex mutex_;
  std::map<balance_key_t, ferry::schema::amount_t> balances_;
  std::map<ferry::schema::asset_id_t, ferry::schema::amount_t> supply_;
  std::set<ferry::schema::asset_id_t> bridgeable_;
  ferry::common::undo_log journal_;
  uint32_t depth_{};
};

}  // namespace ferry::token
