#include <spdlog/spdlog.h>
#include <ferry/blake3/hash.hpp>
#include <ferry/bridge/ledger.hpp>
#include <ferry/schema/key/ledger_keys.hpp>
#include <iterator>
#include <string>
#include <tuple>

using namespace ferry::schema;

namespace {

constexpr auto kCodespace = "ferry.ledger";

using encoder_t =
    ferry::schema::encoding::encoder<ferry::schema::encoding::scale_encoder_tag>;

operation_result_t make_failure(error_code_t code, std::string log) {
  auto result = operation_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.codespace = kCodespace;
  return result;
}

operation_result_t make_status_failure(relocation_status_t status) {
  auto result = make_failure(
      error_code_t::inappropriate_relocation_status,
      "relocation has inappropriate status '" +
          std::string{to_string(status)} + "'");
  result.status = status;
  return result;
}

event_attribute_t make_attribute(std::string key,
                                 std::string value,
                                 bool index = false) {
  return event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

hash32_t fold_state_root(const hash32_t& previous,
                         uint64_t height,
                         const std::vector<event_t>& events) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(std::tuple{height, events});
  return ferry::blake3::hasher{}
      .update(previous)
      .update(bytes_view_t{encoded.data(), encoded.size()})
      .finalize();
}

std::string fee_oracle_label(const ferry::fee::fee_oracle* oracle) {
  return oracle == nullptr ? to_hex(make_zero_hash()) : to_hex(oracle->id());
}

std::string guard_label(const ferry::guard::accommodation_guard* guard) {
  return guard == nullptr ? to_hex(make_zero_hash()) : to_hex(guard->bridge());
}

}  // namespace

namespace ferry::bridge {

ledger::ledger(
    ferry::storage::storage<ferry::storage::rocksdb_storage_tag>& storage,
    ferry::schema::encoding::encoder<
        ferry::schema::encoding::scale_encoder_tag>& encoder,
    ferry::token::token_gateway& tokens,
    ferry::access::access_control& access,
    const account_id_t& self,
    ledger_options options)
    : storage_{storage},
      encoder_{encoder},
      tokens_{tokens},
      access_{access},
      self_{self},
      options_{options} {
  auto lock = std::scoped_lock{mutex_};
  load_persisted_state();
  spdlog::info("Ledger ready at height {} with {} chain(s), {} relocation(s)",
               height_, chains_.size(), relocations_.size());
}

void ledger::load_persisted_state() {
  spdlog::debug("Loading persisted ledger state");
  if (auto committed = storage_.load_committed_state()) {
    height_ = committed->height;
    state_root_ = committed->state_root;
  } else {
    state_root_ = make_zero_hash();
  }

  for (const auto& [raw_key, raw_value] : storage_.list_by_prefix(
           make_bytes_view(key::make_prefix(key::kChainPrefix)))) {
    auto chain_id = key::parse_chain_key(make_bytes_view(raw_key));
    if (!chain_id) {
      ferry::common::critical("malformed chain counters key");
    }
    chains_[*chain_id] =
        encoder_.decode<chain_counters_t>(make_bytes_view(raw_value));
  }

  for (const auto& [raw_key, raw_value] : storage_.list_by_prefix(
           make_bytes_view(key::make_prefix(key::kRelocationPrefix)))) {
    auto parsed = key::parse_relocation_key(make_bytes_view(raw_key));
    if (!parsed) {
      ferry::common::critical("malformed relocation key");
    }
    relocations_[*parsed] =
        encoder_.decode<relocation_t>(make_bytes_view(raw_value));
  }

  for (const auto& [raw_key, raw_value] : storage_.list_by_prefix(
           make_bytes_view(key::make_prefix(key::kModePrefix)))) {
    auto parsed = key::parse_mode_key(make_bytes_view(raw_key));
    if (!parsed) {
      ferry::common::critical("malformed token mode key");
    }
    modes_[*parsed] = encoder_.decode<token_modes_t>(make_bytes_view(raw_value));
  }

  if (auto config = storage_.get<ledger_config_t>(
          encoder_, make_bytes_view(key::make_ledger_config_key()))) {
    config_ = *config;
  }
}

// participant

void ledger::begin() {
  journal_.clear();
  dirty_chains_.clear();
  dirty_relocations_.clear();
  dirty_modes_.clear();
  dirty_config_ = false;
}

void ledger::commit(std::vector<ferry::storage::key_write_t>& writes) {
  for (auto chain_id : dirty_chains_) {
    writes.emplace_back(key::make_chain_key(chain_id),
                        encoder_.encode(chains_.at(chain_id)));
  }
  for (const auto& key : dirty_relocations_) {
    writes.emplace_back(key::make_relocation_key(key.first, key.second),
                        encoder_.encode(relocations_.at(key)));
  }
  for (const auto& key : dirty_modes_) {
    writes.emplace_back(key::make_mode_key(key.first, key.second),
                        encoder_.encode(modes_.at(key)));
  }
  if (dirty_config_) {
    writes.emplace_back(key::make_ledger_config_key(), encoder_.encode(config_));
  }
  begin();
}

void ledger::rollback() {
  journal_.rollback();
  begin();
}

operation_result_t ledger::finish(ferry::storage::transaction& tx,
                                  operation_result_t result,
                                  std::string_view operation) {
  if (!result.ok()) {
    tx.rollback();
    result.codespace = kCodespace;
    result.events.clear();
    spdlog::warn("Rejected {}: {} (code {})", operation, result.log,
                 result.code);
    return result;
  }

  auto height = height_ + 1;
  auto root = fold_state_root(state_root_, height, result.events);
  tx.stage(storage_.make_committed_state_write(
      ferry::storage::committed_state{.height = height, .state_root = root}));
  tx.commit();
  height_ = height;
  state_root_ = root;
  spdlog::info("Committed {} at height {} with {} event(s)", operation,
               height_, result.events.size());
  return result;
}

// state helpers

chain_counters_t& ledger::mutable_counters(chain_id_t chain_id) {
  journal_.track(chains_, chain_id);
  dirty_chains_.insert(chain_id);
  return chains_[chain_id];
}

relocation_t& ledger::mutable_relocation(chain_id_t chain_id, nonce_t nonce) {
  auto key = relocation_key_t{chain_id, nonce};
  journal_.track(relocations_, key);
  dirty_relocations_.insert(key);
  return relocations_[key];
}

token_modes_t& ledger::mutable_modes(chain_id_t chain_id,
                                     const asset_id_t& token) {
  auto key = mode_key_t{chain_id, token};
  journal_.track(modes_, key);
  dirty_modes_.insert(key);
  return modes_[key];
}

void ledger::change_status(chain_id_t chain_id,
                           nonce_t nonce,
                           relocation_status_t new_status,
                           operation_result_t& result) {
  auto& entry = mutable_relocation(chain_id, nonce);
  auto old_status = entry.status;
  entry.status = new_status;
  result.events.push_back(event_t{
      .type = "change_relocation_status",
      .attributes = {
          make_attribute("chain_id", std::to_string(chain_id), true),
          make_attribute("token", to_hex(entry.token), true),
          make_attribute("account", to_hex(entry.account), true),
          make_attribute("amount", to_string(entry.amount)),
          make_attribute("nonce", std::to_string(nonce)),
          make_attribute("new_status", std::string{to_string(new_status)}),
          make_attribute("old_status", std::string{to_string(old_status)})}});
}

token_modes_t ledger::modes_unlocked(chain_id_t chain_id,
                                     const asset_id_t& token) const {
  auto found = modes_.find(mode_key_t{chain_id, token});
  return found == std::end(modes_) ? token_modes_t{} : found->second;
}

chain_counters_t ledger::counters_unlocked(chain_id_t chain_id) const {
  auto found = chains_.find(chain_id);
  return found == std::end(chains_) ? chain_counters_t{} : found->second;
}

bool ledger::is_fee_taken_unlocked() const {
  return fee_oracle_ != nullptr && !is_zero(config_.fee_collector);
}

bool ledger::forward_fee(const relocation_t& entry) {
  if (entry.fee == 0 || is_zero(config_.fee_collector)) {
    return true;
  }
  return tokens_.transfer_out(entry.token, self_, config_.fee_collector,
                              entry.fee);
}

// relocations

operation_result_t ledger::request_relocation(const account_id_t& caller,
                                              chain_id_t chain_id,
                                              const asset_id_t& token,
                                              const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  auto tx = ferry::storage::transaction{storage_, {this, &tokens_}};
  auto result = [&]() -> operation_result_t {
    if (access_.require_not_paused() != error_code_t::ok) {
      return make_failure(error_code_t::paused, "ledger is paused");
    }
    if (is_zero(token)) {
      return make_failure(error_code_t::zero_relocation_token,
                          "relocation token is zero");
    }
    if (amount == 0) {
      return make_failure(error_code_t::zero_relocation_amount,
                          "relocation amount is zero");
    }
    if (modes_unlocked(chain_id, token).relocation_mode ==
        operation_mode_t::unsupported) {
      return make_failure(error_code_t::unsupported_relocation,
                          "token is not supported for relocation to chain " +
                              std::to_string(chain_id));
    }

    auto fee = amount_t{0};
    if (is_fee_taken_unlocked()) {
      fee = fee_oracle_->define_fee(chain_id, token, caller, amount);
    }
    if (sum_overflows(amount, fee)) {
      return make_failure(error_code_t::relocation_amount_overflow,
                          "relocation amount plus fee " + to_string(fee) +
                              " exceeds the amount range");
    }

    auto& counters = mutable_counters(chain_id);
    counters.pending_relocation_count += 1;
    auto nonce = counters.last_processed_relocation_nonce +
                 counters.pending_relocation_count;

    auto& entry = mutable_relocation(chain_id, nonce);
    entry.token = token;
    entry.account = caller;
    entry.amount = amount;
    entry.fee = fee;
    entry.status = relocation_status_t::pending;

    if (!tokens_.transfer_in(token, caller, self_, amount + fee)) {
      return make_failure(error_code_t::token_transfer_failure,
                          "failed to transfer relocation amount into custody");
    }

    auto success = operation_result_t{};
    success.nonce = nonce;
    success.events.push_back(event_t{
        .type = "request_relocation",
        .attributes = {
            make_attribute("chain_id", std::to_string(chain_id), true),
            make_attribute("token", to_hex(token), true),
            make_attribute("account", to_hex(caller), true),
            make_attribute("amount", to_string(amount)),
            make_attribute("nonce", std::to_string(nonce)),
            make_attribute("fee", to_string(fee))}});
    return success;
  }();
  return finish(tx, std::move(result), "request_relocation");
}

operation_result_t ledger::refuse_relocation(chain_id_t chain_id,
                                             nonce_t nonce,
                                             relocation_status_t new_status,
                                             fee_refund_mode_t fee_refund_mode,
                                             operation_result_t& result) {
  auto found = relocations_.find(relocation_key_t{chain_id, nonce});
  auto status = found == std::end(relocations_)
                    ? relocation_status_t::nonexistent
                    : found->second.status;
  if (!is_refusable(status)) {
    auto failure = make_status_failure(status);
    failure.nonce = nonce;
    return failure;
  }

  change_status(chain_id, nonce, new_status, result);
  if (new_status == relocation_status_t::aborted) {
    return operation_result_t{};
  }

  const auto& entry = relocations_.at(relocation_key_t{chain_id, nonce});
  auto refund = entry.amount;
  if (fee_refund_mode == fee_refund_mode_t::full) {
    refund += entry.fee;
  }
  // Without a full refund the fee stays in custody.
  if (!tokens_.transfer_out(entry.token, self_, entry.account, refund)) {
    return make_failure(error_code_t::token_transfer_failure,
                        "failed to refund relocation " + std::to_string(nonce));
  }
  return operation_result_t{};
}

operation_result_t ledger::cancel_relocation(const account_id_t& caller,
                                             chain_id_t chain_id,
                                             nonce_t nonce,
                                             fee_refund_mode_t fee_refund_mode) {
  auto lock = std::scoped_lock{mutex_};
  auto tx = ferry::storage::transaction{storage_, {this, &tokens_}};
  auto result = [&]() -> operation_result_t {
    if (access_.require_not_paused() != error_code_t::ok) {
      return make_failure(error_code_t::paused, "ledger is paused");
    }
    auto found = relocations_.find(relocation_key_t{chain_id, nonce});
    auto is_owner = found != std::end(relocations_) &&
                    found->second.account == caller;
    if (!is_owner &&
        access_.authorize(caller, role_id_t::bridger) != error_code_t::ok) {
      return make_failure(error_code_t::missing_role,
                          "caller is neither the relocation account nor a "
                          "bridger");
    }
    auto success = operation_result_t{};
    auto refused = refuse_relocation(chain_id, nonce,
                                     relocation_status_t::canceled,
                                     fee_refund_mode, success);
    if (!refused.ok()) {
      return refused;
    }
    success.nonce = nonce;
    return success;
  }();
  return finish(tx, std::move(result), "cancel_relocation");
}

operation_result_t ledger::cancel_relocations(
    const account_id_t& caller,
    chain_id_t chain_id,
    const std::vector<nonce_t>& nonces,
    fee_refund_mode_t fee_refund_mode) {
  auto lock = std::scoped_lock{mutex_};
  auto tx = ferry::storage::transaction{storage_, {this, &tokens_}};
  auto result = [&]() -> operation_result_t {
    if (access_.require_not_paused() != error_code_t::ok) {
      return make_failure(error_code_t::paused, "ledger is paused");
    }
    if (access_.authorize(caller, role_id_t::bridger) != error_code_t::ok) {
      return make_failure(error_code_t::missing_role,
                          "caller does not hold the bridger role");
    }
    if (nonces.empty()) {
      return make_failure(error_code_t::empty_cancellation_batch,
                          "no relocation nonces to cancel");
    }
    auto success = operation_result_t{};
    for (size_t i = 0; i < nonces.size(); ++i) {
      auto refused = refuse_relocation(chain_id, nonces[i],
                                       relocation_status_t::canceled,
                                       fee_refund_mode, success);
      if (!refused.ok()) {
        refused.index = i;
        return refused;
      }
      spdlog::debug("Canceled relocation {} of chain {}", nonces[i], chain_id);
    }
    return success;
  }();
  return finish(tx, std::move(result), "cancel_relocations");
}

operation_result_t ledger::reject_relocation(const account_id_t& caller,
                                             chain_id_t chain_id,
                                             nonce_t nonce,
                                             fee_refund_mode_t fee_refund_mode) {
  auto lock = std::scoped_lock{mutex_};
  auto tx = ferry::storage::transaction{storage_, {this, &tokens_}};
  auto result = [&]() -> operation_result_t {
    if (access_.require_not_paused() != error_code_t::ok) {
      return make_failure(error_code_t::paused, "ledger is paused");
    }
    if (access_.authorize(caller, role_id_t::bridger) != error_code_t::ok) {
      return make_failure(error_code_t::missing_role,
                          "caller does not hold the bridger role");
    }
    auto success = operation_result_t{};
    auto refused = refuse_relocation(chain_id, nonce,
                                     relocation_status_t::rejected,
                                     fee_refund_mode, success);
    if (!refused.ok()) {
      return refused;
    }
    success.nonce = nonce;
    return success;
  }();
  return finish(tx, std::move(result), "reject_relocation");
}

operation_result_t ledger::abort_relocation(const account_id_t& caller,
                                            chain_id_t chain_id,
                                            nonce_t nonce) {
  auto lock = std::scoped_lock{mutex_};
  auto tx = ferry::storage::transaction{storage_, {this, &tokens_}};
  auto result = [&]() -> operation_result_t {
    if (access_.require_not_paused() != error_code_t::ok) {
      return make_failure(error_code_t::paused, "ledger is paused");
    }
    if (access_.authorize(caller, role_id_t::bridger) != error_code_t::ok) {
      return make_failure(error_code_t::missing_role,
                          "caller does not hold the bridger role");
    }
    auto success = operation_result_t{};
    auto refused = refuse_relocation(chain_id, nonce,
                                     relocation_status_t::aborted,
                                     fee_refund_mode_t::nothing, success);
    if (!refused.ok()) {
      return refused;
    }
    success.nonce = nonce;
    return success;
  }();
  return finish(tx, std::move(result), "abort_relocation");
}

operation_result_t ledger::postpone_relocation(const account_id_t& caller,
                                               chain_id_t chain_id,
                                               nonce_t nonce) {
  auto lock = std::scoped_lock{mutex_};
  auto tx = ferry::storage::transaction{storage_, {this}};
  auto result = [&]() -> operation_result_t {
    if (access_.require_not_paused() != error_code_t::ok) {
      return make_failure(error_code_t::paused, "ledger is paused");
    }
    if (access_.authorize(caller, role_id_t::bridger) != error_code_t::ok) {
      return make_failure(error_code_t::missing_role,
                          "caller does not hold the bridger role");
    }
    auto status = relocation_unlocked(chain_id, nonce).status;
    if (status != relocation_status_t::pending) {
      auto failure = make_status_failure(status);
      failure.nonce = nonce;
      return failure;
    }
    auto success = operation_result_t{};
    change_status(chain_id, nonce, relocation_status_t::postponed, success);
    success.nonce = nonce;
    return success;
  }();
  return finish(tx, std::move(result), "postpone_relocation");
}

operation_result_t ledger::continue_relocation(const account_id_t& caller,
                                               chain_id_t chain_id,
                                               nonce_t nonce) {
  auto lock = std::scoped_lock{mutex_};
  auto tx = ferry::storage::transaction{storage_, {this}};
  auto result = [&]() -> operation_result_t {
    if (access_.require_not_paused() != error_code_t::ok) {
      return make_failure(error_code_t::paused, "ledger is paused");
    }
    if (access_.authorize(caller, role_id_t::bridger) != error_code_t::ok) {
      return make_failure(error_code_t::missing_role,
                          "caller does not hold the bridger role");
    }
    auto original = relocation_unlocked(chain_id, nonce);
    if (original.status != relocation_status_t::postponed) {
      auto failure = make_status_failure(original.status);
      failure.nonce = nonce;
      return failure;
    }

    auto& counters = mutable_counters(chain_id);
    counters.pending_relocation_count += 1;
    auto new_nonce = counters.last_processed_relocation_nonce +
                     counters.pending_relocation_count;

    auto success = operation_result_t{};
    auto& fresh = mutable_relocation(chain_id, new_nonce);
    fresh.token = original.token;
    fresh.account = original.account;
    fresh.amount = original.amount;
    fresh.fee = original.fee;
    fresh.old_nonce = nonce;
    fresh.status = relocation_status_t::pending;

    mutable_relocation(chain_id, nonce).new_nonce = new_nonce;
    change_status(chain_id, nonce, relocation_status_t::continued, success);

    spdlog::debug("Continued relocation {} of chain {} as {}", nonce, chain_id,
                  new_nonce);
    success.nonce = new_nonce;
    return success;
  }();
  return finish(tx, std::move(result), "continue_relocation");
}

operation_result_t ledger::relocate(const account_id_t& caller,
                                    chain_id_t chain_id,
                                    uint64_t count) {
  auto lock = std::scoped_lock{mutex_};
  auto tx = ferry::storage::transaction{storage_, {this, &tokens_}};
  auto result = [&]() -> operation_result_t {
    if (access_.require_not_paused() != error_code_t::ok) {
      return make_failure(error_code_t::paused, "ledger is paused");
    }
    if (access_.authorize(caller, role_id_t::bridger) != error_code_t::ok) {
      return make_failure(error_code_t::missing_role,
                          "caller does not hold the bridger role");
    }
    if (count == 0) {
      return make_failure(error_code_t::zero_relocation_count,
                          "relocation count is zero");
    }
    if (count > counters_unlocked(chain_id).pending_relocation_count) {
      return make_failure(error_code_t::lack_of_pending_relocations,
                          "not enough pending relocations for chain " +
                              std::to_string(chain_id));
    }

    auto& counters = mutable_counters(chain_id);
    auto first = counters.last_processed_relocation_nonce + 1;
    counters.last_processed_relocation_nonce += count;
    counters.pending_relocation_count -= count;

    auto success = operation_result_t{};
    for (auto nonce = first; nonce < first + count; ++nonce) {
      auto current = relocation_unlocked(chain_id, nonce);
      if (current.status != relocation_status_t::pending) {
        spdlog::debug("Skipping relocation {} of chain {} with status '{}'",
                      nonce, chain_id, to_string(current.status));
        continue;
      }

      auto mode = modes_unlocked(chain_id, current.token).relocation_mode;
      if (mode == operation_mode_t::unsupported) {
        auto failure = make_failure(error_code_t::unsupported_relocation,
                                    "relocation mode of the token was reset");
        failure.nonce = nonce;
        return failure;
      }
      change_status(chain_id, nonce, relocation_status_t::processed, success);

      if (mode == operation_mode_t::burn_or_mint &&
          !tokens_.burn(current.token, self_, current.amount)) {
        auto failure = make_failure(error_code_t::token_burning_failure,
                                    "failed to burn relocated tokens");
        failure.nonce = nonce;
        return failure;
      }
      if (!forward_fee(current)) {
        auto failure = make_failure(error_code_t::token_transfer_failure,
                                    "failed to forward relocation fee");
        failure.nonce = nonce;
        return failure;
      }

      success.events.push_back(event_t{
          .type = "relocate",
          .attributes = {
              make_attribute("chain_id", std::to_string(chain_id), true),
              make_attribute("token", to_hex(current.token), true),
              make_attribute("account", to_hex(current.account), true),
              make_attribute("amount", to_string(current.amount)),
              make_attribute("nonce", std::to_string(nonce)),
              make_attribute("fee", to_string(current.fee)),
              make_attribute("mode", std::string{to_string(mode)})}});
      spdlog::debug("Relocated {} of chain {}", nonce, chain_id);
    }
    success.nonce = counters.last_processed_relocation_nonce;
    return success;
  }();
  return finish(tx, std::move(result), "relocate");
}

// accommodations

operation_result_t ledger::accommodate(
    const account_id_t& caller,
    chain_id_t chain_id,
    nonce_t nonce,
    const std::vector<accommodation_t>& entries) {
  auto lock = std::scoped_lock{mutex_};
  auto tx = ferry::storage::transaction{storage_, {this, &tokens_, guard_}};
  auto result = [&]() -> operation_result_t {
    if (access_.require_not_paused() != error_code_t::ok) {
      return make_failure(error_code_t::paused, "ledger is paused");
    }
    if (access_.authorize(caller, role_id_t::bridger) != error_code_t::ok) {
      return make_failure(error_code_t::missing_role,
                          "caller does not hold the bridger role");
    }
    if (nonce == 0) {
      return make_failure(error_code_t::zero_accommodation_nonce,
                          "accommodation nonce is zero");
    }
    auto expected = counters_unlocked(chain_id).last_accommodation_nonce + 1;
    if (nonce != expected) {
      return make_failure(error_code_t::accommodation_nonce_mismatch,
                          "expected accommodation nonce " +
                              std::to_string(expected) + ", got " +
                              std::to_string(nonce));
    }
    if (entries.empty()) {
      return make_failure(error_code_t::empty_accommodation_batch,
                          "accommodation batch is empty");
    }

    for (size_t i = 0; i < entries.size(); ++i) {
      const auto& entry = entries[i];
      auto failure = std::optional<operation_result_t>{};
      if (modes_unlocked(chain_id, entry.token).accommodation_mode ==
          operation_mode_t::unsupported) {
        failure = make_failure(error_code_t::unsupported_accommodation,
                               "token is not supported for accommodation");
      } else if (is_zero(entry.account)) {
        failure = make_failure(error_code_t::zero_accommodation_account,
                               "accommodation account is zero");
      } else if (entry.amount == 0) {
        failure = make_failure(error_code_t::zero_accommodation_amount,
                               "accommodation amount is zero");
      }
      if (failure) {
        failure->index = i;
        return *failure;
      }
    }

    auto& counters = mutable_counters(chain_id);
    counters.last_accommodation_nonce += entries.size();

    auto success = operation_result_t{};
    for (size_t i = 0; i < entries.size(); ++i) {
      const auto& entry = entries[i];
      if (entry.status != relocation_status_t::processed) {
        continue;
      }

      if (guard_ != nullptr) {
        auto verdict = guard_->validate(self_, chain_id, entry.token,
                                        entry.account, entry.amount);
        if (!verdict.ok()) {
          verdict.index = i;
          return verdict;
        }
        if (verdict.guard_status != guard_validation_status_t::no_error) {
          auto failure = make_failure(
              error_code_t::accommodation_guard_rejected,
              "accommodation guard returned '" +
                  std::string{to_string(*verdict.guard_status)} + "'");
          failure.index = i;
          failure.guard_status = verdict.guard_status;
          return failure;
        }
      }

      auto mode = modes_unlocked(chain_id, entry.token).accommodation_mode;
      if (mode == operation_mode_t::burn_or_mint) {
        if (!tokens_.mint(entry.token, entry.account, entry.amount)) {
          auto failure = make_failure(error_code_t::token_minting_failure,
                                      "failed to mint accommodated tokens");
          failure.index = i;
          return failure;
        }
      } else if (!tokens_.transfer_out(entry.token, self_, entry.account,
                                       entry.amount)) {
        auto failure = make_failure(error_code_t::token_transfer_failure,
                                    "failed to release accommodated tokens");
        failure.index = i;
        return failure;
      }

      success.events.push_back(event_t{
          .type = "accommodate",
          .attributes = {
              make_attribute("chain_id", std::to_string(chain_id), true),
              make_attribute("token", to_hex(entry.token), true),
              make_attribute("account", to_hex(entry.account), true),
              make_attribute("amount", to_string(entry.amount)),
              make_attribute("nonce", std::to_string(nonce + i)),
              make_attribute("mode", std::string{to_string(mode)})}});
      spdlog::debug("Accommodated {} of chain {} to {}", nonce + i, chain_id,
                    to_hex(entry.account));
    }
    success.nonce = counters.last_accommodation_nonce;
    return success;
  }();
  return finish(tx, std::move(result), "accommodate");
}

// configuration

operation_result_t ledger::set_relocation_mode(const account_id_t& caller,
                                               chain_id_t chain_id,
                                               const asset_id_t& token,
                                               operation_mode_t mode) {
  auto lock = std::scoped_lock{mutex_};
  auto tx = ferry::storage::transaction{storage_, {this}};
  auto result = [&]() -> operation_result_t {
    if (access_.authorize(caller, role_id_t::owner) != error_code_t::ok) {
      return make_failure(error_code_t::missing_role,
                          "caller does not hold the owner role");
    }
    auto old_mode = modes_unlocked(chain_id, token).relocation_mode;
    if (old_mode == mode) {
      return make_failure(error_code_t::unchanged_relocation_mode,
                          "relocation mode is unchanged");
    }
    if (options_.immutable_modes && old_mode != operation_mode_t::unsupported) {
      return make_failure(error_code_t::relocation_mode_is_immutable,
                          "relocation mode has already been set");
    }
    if (mode == operation_mode_t::burn_or_mint &&
        !tokens_.supports_bridge(token)) {
      return make_failure(error_code_t::non_bridgeable_token,
                          "token does not support burning and minting");
    }
    mutable_modes(chain_id, token).relocation_mode = mode;

    auto success = operation_result_t{};
    success.events.push_back(event_t{
        .type = "set_relocation_mode",
        .attributes = {
            make_attribute("chain_id", std::to_string(chain_id), true),
            make_attribute("token", to_hex(token), true),
            make_attribute("old_mode", std::string{to_string(old_mode)}),
            make_attribute("new_mode", std::string{to_string(mode)})}});
    return success;
  }();
  return finish(tx, std::move(result), "set_relocation_mode");
}

operation_result_t ledger::set_accommodation_mode(const account_id_t& caller,
                                                  chain_id_t chain_id,
                                                  const asset_id_t& token,
                                                  operation_mode_t mode) {
  auto lock = std::scoped_lock{mutex_};
  auto tx = ferry::storage::transaction{storage_, {this}};
  auto result = [&]() -> operation_result_t {
    if (access_.authorize(caller, role_id_t::owner) != error_code_t::ok) {
      return make_failure(error_code_t::missing_role,
                          "caller does not hold the owner role");
    }
    auto old_mode = modes_unlocked(chain_id, token).accommodation_mode;
    if (old_mode == mode) {
      return make_failure(error_code_t::unchanged_accommodation_mode,
                          "accommodation mode is unchanged");
    }
    if (options_.immutable_modes && old_mode != operation_mode_t::unsupported) {
      return make_failure(error_code_t::accommodation_mode_is_immutable,
                          "accommodation mode has already been set");
    }
    if (mode == operation_mode_t::burn_or_mint &&
        !tokens_.supports_bridge(token)) {
      return make_failure(error_code_t::non_bridgeable_token,
                          "token does not support burning and minting");
    }
    mutable_modes(chain_id, token).accommodation_mode = mode;

    auto success = operation_result_t{};
    success.events.push_back(event_t{
        .type = "set_accommodation_mode",
        .attributes = {
            make_attribute("chain_id", std::to_string(chain_id), true),
            make_attribute("token", to_hex(token), true),
            make_attribute("old_mode", std::string{to_string(old_mode)}),
            make_attribute("new_mode", std::string{to_string(mode)})}});
    return success;
  }();
  return finish(tx, std::move(result), "set_accommodation_mode");
}

operation_result_t ledger::set_fee_oracle(const account_id_t& caller,
                                          ferry::fee::fee_oracle* oracle) {
  auto lock = std::scoped_lock{mutex_};
  auto tx = ferry::storage::transaction{storage_, {this}};
  auto result = [&]() -> operation_result_t {
    if (access_.authorize(caller, role_id_t::owner) != error_code_t::ok) {
      return make_failure(error_code_t::missing_role,
                          "caller does not hold the owner role");
    }
    if (oracle == fee_oracle_) {
      return make_failure(error_code_t::unchanged_fee_oracle,
                          "fee oracle is unchanged");
    }
    auto success = operation_result_t{};
    success.events.push_back(event_t{
        .type = "set_fee_oracle",
        .attributes = {make_attribute("old_oracle", fee_oracle_label(fee_oracle_)),
                       make_attribute("new_oracle", fee_oracle_label(oracle))}});
    journal_.track(fee_oracle_);
    fee_oracle_ = oracle;
    return success;
  }();
  return finish(tx, std::move(result), "set_fee_oracle");
}

operation_result_t ledger::set_fee_collector(const account_id_t& caller,
                                             const account_id_t& collector) {
  auto lock = std::scoped_lock{mutex_};
  auto tx = ferry::storage::transaction{storage_, {this}};
  auto result = [&]() -> operation_result_t {
    if (access_.authorize(caller, role_id_t::owner) != error_code_t::ok) {
      return make_failure(error_code_t::missing_role,
                          "caller does not hold the owner role");
    }
    if (collector == config_.fee_collector) {
      return make_failure(error_code_t::unchanged_fee_collector,
                          "fee collector is unchanged");
    }
    auto success = operation_result_t{};
    success.events.push_back(event_t{
        .type = "set_fee_collector",
        .attributes = {
            make_attribute("old_collector", to_hex(config_.fee_collector)),
            make_attribute("new_collector", to_hex(collector))}});
    journal_.track(config_);
    config_.fee_collector = collector;
    dirty_config_ = true;
    return success;
  }();
  return finish(tx, std::move(result), "set_fee_collector");
}

operation_result_t ledger::set_accommodation_guard(
    const account_id_t& caller,
    ferry::guard::accommodation_guard* guard) {
  auto lock = std::scoped_lock{mutex_};
  auto tx = ferry::storage::transaction{storage_, {this}};
  auto result = [&]() -> operation_result_t {
    if (access_.authorize(caller, role_id_t::owner) != error_code_t::ok) {
      return make_failure(error_code_t::missing_role,
                          "caller does not hold the owner role");
    }
    if (guard == guard_) {
      return make_failure(error_code_t::unchanged_accommodation_guard,
                          "accommodation guard is unchanged");
    }
    auto success = operation_result_t{};
    success.events.push_back(event_t{
        .type = "set_accommodation_guard",
        .attributes = {make_attribute("old_guard_bridge", guard_label(guard_)),
                       make_attribute("new_guard_bridge", guard_label(guard))}});
    journal_.track(guard_);
    guard_ = guard;
    return success;
  }();
  return finish(tx, std::move(result), "set_accommodation_guard");
}

// reads

uint64_t ledger::pending_relocation_count(chain_id_t chain_id) const {
  auto lock = std::scoped_lock{mutex_};
  return counters_unlocked(chain_id).pending_relocation_count;
}

nonce_t ledger::last_processed_relocation_nonce(chain_id_t chain_id) const {
  auto lock = std::scoped_lock{mutex_};
  return counters_unlocked(chain_id).last_processed_relocation_nonce;
}

nonce_t ledger::last_accommodation_nonce(chain_id_t chain_id) const {
  auto lock = std::scoped_lock{mutex_};
  return counters_unlocked(chain_id).last_accommodation_nonce;
}

chain_counters_t ledger::counters(chain_id_t chain_id) const {
  auto lock = std::scoped_lock{mutex_};
  return counters_unlocked(chain_id);
}

std::vector<chain_id_t> ledger::chains() const {
  auto lock = std::scoped_lock{mutex_};
  auto ids = std::vector<chain_id_t>{};
  ids.reserve(chains_.size());
  for (const auto& [chain_id, counters] : chains_) {
    ids.push_back(chain_id);
  }
  return ids;
}

operation_mode_t ledger::relocation_mode(chain_id_t chain_id,
                                         const asset_id_t& token) const {
  auto lock = std::scoped_lock{mutex_};
  return modes_unlocked(chain_id, token).relocation_mode;
}

operation_mode_t ledger::accommodation_mode(chain_id_t chain_id,
                                            const asset_id_t& token) const {
  auto lock = std::scoped_lock{mutex_};
  return modes_unlocked(chain_id, token).accommodation_mode;
}

relocation_t ledger::relocation(chain_id_t chain_id, nonce_t nonce) const {
  auto lock = std::scoped_lock{mutex_};
  return relocation_unlocked(chain_id, nonce);
}

relocation_t ledger::relocation_unlocked(chain_id_t chain_id,
                                         nonce_t nonce) const {
  auto found = relocations_.find(relocation_key_t{chain_id, nonce});
  return found == std::end(relocations_) ? relocation_t{} : found->second;
}

std::vector<relocation_t> ledger::relocations(chain_id_t chain_id,
                                              nonce_t first_nonce,
                                              uint64_t count) const {
  auto lock = std::scoped_lock{mutex_};
  auto entries = std::vector<relocation_t>{};
  entries.reserve(count);
  for (uint64_t i = 0; i < count; ++i) {
    entries.push_back(relocation_unlocked(chain_id, first_nonce + i));
  }
  return entries;
}

ferry::fee::fee_oracle* ledger::fee_oracle() const {
  auto lock = std::scoped_lock{mutex_};
  return fee_oracle_;
}

account_id_t ledger::fee_collector() const {
  auto lock = std::scoped_lock{mutex_};
  return config_.fee_collector;
}

ferry::guard::accommodation_guard* ledger::accommodation_guard() const {
  auto lock = std::scoped_lock{mutex_};
  return guard_;
}

bool ledger::is_fee_taken() const {
  auto lock = std::scoped_lock{mutex_};
  return is_fee_taken_unlocked();
}

ledger_info_t ledger::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto info = ledger_info_t{};
  info.height = height_;
  info.state_root = state_root_;
  return info;
}

}  // namespace ferry::bridge
