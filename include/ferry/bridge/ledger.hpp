#pragma once

#include <ferry/access/access_control.hpp>
#include <ferry/common/undo_log.hpp>
#include <ferry/fee/fee_oracle.hpp>
#include <ferry/guard/accommodation_guard.hpp>
#include <ferry/schema/accommodation.hpp>
#include <ferry/schema/chain_counters.hpp>
#include <ferry/schema/encoding/encoder.hpp>
#include <ferry/schema/encoding/scale/encoder.hpp>
#include <ferry/schema/fee_refund_mode.hpp>
#include <ferry/schema/ledger_config.hpp>
#include <ferry/schema/ledger_info.hpp>
#include <ferry/schema/operation_mode.hpp>
#include <ferry/schema/operation_result.hpp>
#include <ferry/schema/primitives.hpp>
#include <ferry/schema/relocation.hpp>
#include <ferry/schema/token_modes.hpp>
#include <ferry/storage/rocksdb/storage.hpp>
#include <ferry/storage/transaction.hpp>
#include <ferry/token/token_gateway.hpp>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <utility>
#include <vector>

namespace ferry::bridge {

struct ledger_options final {
  /// Once a relocation or accommodation mode leaves `unsupported` it can no
  /// longer be changed.
  bool immutable_modes{true};
};

/// Per-chain relocation and accommodation ledger.
///
/// Outgoing value is recorded as relocations keyed by (chain_id, nonce) and
/// pulled into the custody account `self`. Incoming value arrives as ordered
/// accommodation batches reported by a bridger. Every mutating entry point is
/// serialized and atomic: on failure the ledger, the token gateway and the
/// accommodation guard are left exactly as before the call.
///
/// Committed operations are persisted through one RocksDB write batch and
/// folded into a BLAKE3 state root reported by `info()`.
class ledger final : private ferry::storage::participant {
 public:
  ledger(ferry::storage::storage<ferry::storage::rocksdb_storage_tag>& storage,
         ferry::schema::encoding::encoder<
             ferry::schema::encoding::scale_encoder_tag>& encoder,
         ferry::token::token_gateway& tokens,
         ferry::access::access_control& access,
         const ferry::schema::account_id_t& self,
         ledger_options options = {});

  /// Record a pending relocation of `amount` (plus fee) from `caller`.
  ///
  /// On success `nonce` holds the assigned relocation nonce.
  ferry::schema::operation_result_t request_relocation(
      const ferry::schema::account_id_t& caller,
      ferry::schema::chain_id_t chain_id,
      const ferry::schema::asset_id_t& token,
      const ferry::schema::amount_t& amount);

  /// Return the principal (and the fee for `full`) of a pending or postponed
  /// relocation to its account. Callable by the account itself or a bridger.
  ferry::schema::operation_result_t cancel_relocation(
      const ferry::schema::account_id_t& caller,
      ferry::schema::chain_id_t chain_id,
      ferry::schema::nonce_t nonce,
      ferry::schema::fee_refund_mode_t fee_refund_mode);

  /// Cancel several relocations at once; any unsuitable nonce fails the batch.
  ferry::schema::operation_result_t cancel_relocations(
      const ferry::schema::account_id_t& caller,
      ferry::schema::chain_id_t chain_id,
      const std::vector<ferry::schema::nonce_t>& nonces,
      ferry::schema::fee_refund_mode_t fee_refund_mode);

  ferry::schema::operation_result_t reject_relocation(
      const ferry::schema::account_id_t& caller,
      ferry::schema::chain_id_t chain_id,
      ferry::schema::nonce_t nonce,
      ferry::schema::fee_refund_mode_t fee_refund_mode);

  /// Terminate a relocation while keeping principal and fee in custody.
  ferry::schema::operation_result_t abort_relocation(
      const ferry::schema::account_id_t& caller,
      ferry::schema::chain_id_t chain_id,
      ferry::schema::nonce_t nonce);

  ferry::schema::operation_result_t postpone_relocation(
      const ferry::schema::account_id_t& caller,
      ferry::schema::chain_id_t chain_id,
      ferry::schema::nonce_t nonce);

  /// Re-queue a postponed relocation under a fresh nonce (returned in
  /// `nonce`).
  ferry::schema::operation_result_t continue_relocation(
      const ferry::schema::account_id_t& caller,
      ferry::schema::chain_id_t chain_id,
      ferry::schema::nonce_t nonce);

  /// Settle the next `count` queued relocations of `chain_id`.
  ferry::schema::operation_result_t relocate(
      const ferry::schema::account_id_t& caller,
      ferry::schema::chain_id_t chain_id,
      uint64_t count);

  /// Apply a batch of source-side relocations starting at `nonce`.
  ferry::schema::operation_result_t accommodate(
      const ferry::schema::account_id_t& caller,
      ferry::schema::chain_id_t chain_id,
      ferry::schema::nonce_t nonce,
      const std::vector<ferry::schema::accommodation_t>& entries);

  ferry::schema::operation_result_t set_relocation_mode(
      const ferry::schema::account_id_t& caller,
      ferry::schema::chain_id_t chain_id,
      const ferry::schema::asset_id_t& token,
      ferry::schema::operation_mode_t mode);
  ferry::schema::operation_result_t set_accommodation_mode(
      const ferry::schema::account_id_t& caller,
      ferry::schema::chain_id_t chain_id,
      const ferry::schema::asset_id_t& token,
      ferry::schema::operation_mode_t mode);

  /// Install (or clear, with nullptr) the fee oracle. Not owned.
  ferry::schema::operation_result_t set_fee_oracle(
      const ferry::schema::account_id_t& caller,
      ferry::fee::fee_oracle* oracle);
  ferry::schema::operation_result_t set_fee_collector(
      const ferry::schema::account_id_t& caller,
      const ferry::schema::account_id_t& collector);
  /// Install (or clear, with nullptr) the accommodation guard. Not owned.
  ferry::schema::operation_result_t set_accommodation_guard(
      const ferry::schema::account_id_t& caller,
      ferry::guard::accommodation_guard* guard);

  uint64_t pending_relocation_count(ferry::schema::chain_id_t chain_id) const;
  ferry::schema::nonce_t last_processed_relocation_nonce(
      ferry::schema::chain_id_t chain_id) const;
  ferry::schema::nonce_t last_accommodation_nonce(
      ferry::schema::chain_id_t chain_id) const;
  ferry::schema::chain_counters_t counters(
      ferry::schema::chain_id_t chain_id) const;
  std::vector<ferry::schema::chain_id_t> chains() const;

  ferry::schema::operation_mode_t relocation_mode(
      ferry::schema::chain_id_t chain_id,
      const ferry::schema::asset_id_t& token) const;
  ferry::schema::operation_mode_t accommodation_mode(
      ferry::schema::chain_id_t chain_id,
      const ferry::schema::asset_id_t& token) const;

  /// Stored relocation, default-initialized (`nonexistent`) when absent.
  ferry::schema::relocation_t relocation(ferry::schema::chain_id_t chain_id,
                                         ferry::schema::nonce_t nonce) const;
  std::vector<ferry::schema::relocation_t> relocations(
      ferry::schema::chain_id_t chain_id,
      ferry::schema::nonce_t first_nonce,
      uint64_t count) const;

  ferry::fee::fee_oracle* fee_oracle() const;
  ferry::schema::account_id_t fee_collector() const;
  ferry::guard::accommodation_guard* accommodation_guard() const;
  /// Fees are charged only while both an oracle and a collector are set.
  bool is_fee_taken() const;

  /// Height and state root of the last committed operation.
  ferry::schema::ledger_info_t info() const;

  ferry::schema::account_id_t self() const { return self_; }

 private:
  using relocation_key_t =
      std::pair<ferry::schema::chain_id_t, ferry::schema::nonce_t>;
  using mode_key_t =
      std::pair<ferry::schema::chain_id_t, ferry::schema::asset_id_t>;

  void begin() override;
  void commit(std::vector<ferry::storage::key_write_t>& writes) override;
  void rollback() override;

  void load_persisted_state();

  /// Roll back on failure, otherwise advance the state root and commit.
  ferry::schema::operation_result_t finish(
      ferry::storage::transaction& tx,
      ferry::schema::operation_result_t result,
      std::string_view operation);

  ferry::schema::operation_result_t refuse_relocation(
      ferry::schema::chain_id_t chain_id,
      ferry::schema::nonce_t nonce,
      ferry::schema::relocation_status_t new_status,
      ferry::schema::fee_refund_mode_t fee_refund_mode,
      ferry::schema::operation_result_t& result);
  bool forward_fee(const ferry::schema::relocation_t& entry);

  ferry::schema::chain_counters_t& mutable_counters(
      ferry::schema::chain_id_t chain_id);
  ferry::schema::relocation_t& mutable_relocation(
      ferry::schema::chain_id_t chain_id,
      ferry::schema::nonce_t nonce);
  ferry::schema::token_modes_t& mutable_modes(
      ferry::schema::chain_id_t chain_id,
      const ferry::schema::asset_id_t& token);
  void change_status(ferry::schema::chain_id_t chain_id,
                     ferry::schema::nonce_t nonce,
                     ferry::schema::relocation_status_t new_status,
                     ferry::schema::operation_result_t& result);

  ferry::schema::token_modes_t modes_unlocked(
      ferry::schema::chain_id_t chain_id,
      const ferry::schema::asset_id_t& token) const;
  ferry::schema::relocation_t relocation_unlocked(
      ferry::schema::chain_id_t chain_id,
      ferry::schema::nonce_t nonce) const;
  ferry::schema::chain_counters_t counters_unlocked(
      ferry::schema::chain_id_t chain_id) const;
  bool is_fee_taken_unlocked() const;

  mutable std::mutex mutex_;
  ferry::storage::storage<ferry::storage::rocksdb_storage_tag>& storage_;
  ferry::schema::encoding::encoder<ferry::schema::encoding::scale_encoder_tag>&
      encoder_;
  ferry::token::token_gateway& tokens_;
  ferry::access::access_control& access_;
  ferry::schema::account_id_t self_;
  ledger_options options_;

  std::map<ferry::schema::chain_id_t, ferry::schema::chain_counters_t> chains_;
  std::map<relocation_key_t, ferry::schema::relocation_t> relocations_;
  std::map<mode_key_t, ferry::schema::token_modes_t> modes_;
  ferry::schema::ledger_config_t config_;
  ferry::fee::fee_oracle* fee_oracle_{nullptr};
  ferry::guard::accommodation_guard* guard_{nullptr};

  uint64_t height_{};
  ferry::schema::hash32_t state_root_{};

  ferry::common::undo_log journal_;
  std::set<ferry::schema::chain_id_t> dirty_chains_;
  std::set<relocation_key_t> dirty_relocations_;
  std::set<mode_key_t> dirty_modes_;
  bool dirty_config_{false};
};

}  // namespace ferry::bridge
