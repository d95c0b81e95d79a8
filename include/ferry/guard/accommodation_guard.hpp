#pragma once

#include <ferry/common/undo_log.hpp>
#include <ferry/schema/encoding/scale/encoder.hpp>
#include <ferry/schema/guard_config.hpp>
#include <ferry/schema/guard_validation_status.hpp>
#include <ferry/schema/operation_result.hpp>
#include <ferry/schema/primitives.hpp>
#include <ferry/storage/rocksdb/storage.hpp>
#include <ferry/storage/transaction.hpp>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <utility>

namespace ferry::guard {

using clock_fn_t = std::function<ferry::schema::timestamp_milliseconds_t()>;

/// Wall clock in milliseconds since the epoch.
ferry::schema::timestamp_milliseconds_t system_clock_milliseconds();

/// Per (chain_id, token) volume limiter consulted before value is credited.
///
/// Each configured pair owns a fixed window of `time_frame` milliseconds
/// during which at most `volume_limit` may be accommodated. Only the
/// registered bridge account may consume volume; only the owner may change
/// configuration. Configuration rows live under `GUARD|CONFIG|` and the bridge
/// account under `GUARD|BRIDGE`.
///
/// The guard joins the ledger's unit of work, so volume consumed by a failed
/// accommodation batch is restored.
class accommodation_guard final : public ferry::storage::participant {
 public:
  accommodation_guard(
      ferry::storage::storage<ferry::storage::rocksdb_storage_tag>& storage,
      ferry::schema::encoding::encoder<
          ferry::schema::encoding::scale_encoder_tag>& encoder,
      const ferry::schema::account_id_t& owner,
      const ferry::schema::account_id_t& bridge,
      clock_fn_t clock = system_clock_milliseconds);

  /// Replace the registered bridge account.
  ferry::schema::operation_result_t set_bridge(
      const ferry::schema::account_id_t& caller,
      const ferry::schema::account_id_t& bridge);

  /// Create or update the window for (chain_id, token).
  ///
  /// The first configuration starts a fresh window at the current time. Later
  /// calls only replace `time_frame` and `volume_limit`; the running window
  /// and its consumed volume carry over.
  ferry::schema::operation_result_t configure(
      const ferry::schema::account_id_t& caller,
      ferry::schema::chain_id_t chain_id,
      const ferry::schema::asset_id_t& token,
      ferry::schema::duration_milliseconds_t time_frame,
      const ferry::schema::amount_t& volume_limit);

  /// Drop the configuration for (chain_id, token).
  ferry::schema::operation_result_t reset(
      const ferry::schema::account_id_t& caller,
      ferry::schema::chain_id_t chain_id,
      const ferry::schema::asset_id_t& token);

  /// Consume `amount` of the current window.
  ///
  /// `code` is `not_bridge` for any caller other than the bridge; otherwise
  /// the outcome is carried in `guard_status`.
  ferry::schema::operation_result_t validate(
      const ferry::schema::account_id_t& caller,
      ferry::schema::chain_id_t chain_id,
      const ferry::schema::asset_id_t& token,
      const ferry::schema::account_id_t& account,
      const ferry::schema::amount_t& amount);

  /// Stored configuration, zeroed when the pair was never configured.
  ferry::schema::guard_config_t config(ferry::schema::chain_id_t chain_id,
                                       const ferry::schema::asset_id_t& token)
      const;
  ferry::schema::account_id_t bridge() const;
  ferry::schema::account_id_t owner() const { return owner_; }

  void begin() override;
  void commit(std::vector<ferry::storage::key_write_t>& writes) override;
  void rollback() override;

 private:
  using pair_key_t =
      std::pair<ferry::schema::chain_id_t, ferry::schema::asset_id_t>;

  void load_persisted_state();
  ferry::schema::operation_result_t require_owner(
      const ferry::schema::account_id_t& caller,
      std::string_view action) const;

  mutable std::recursive_mutex mutex_;
  ferry::storage::storage<ferry::storage::rocksdb_storage_tag>& storage_;
  ferry::schema::encoding::encoder<ferry::schema::encoding::scale_encoder_tag>&
      encoder_;
  ferry::schema::account_id_t owner_;
  ferry::schema::account_id_t bridge_;
  clock_fn_t clock_;
  std::map<pair_key_t, ferry::schema::guard_config_t> configs_;
  ferry::common::undo_log journal_;
  std::set<pair_key_t> dirty_configs_;
  bool dirty_bridge_{false};
  uint32_t depth_{};
};

}  // namespace ferry::guard
