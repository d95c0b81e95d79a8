#include <spdlog/spdlog.h>
#include <chrono>
#include <ferry/guard/accommodation_guard.hpp>
#include <ferry/schema/key/ledger_keys.hpp>
#include <string>

using namespace ferry::schema;

namespace {

constexpr auto kCodespace = "ferry.guard";

operation_result_t make_failure(error_code_t code, std::string log) {
  auto result = operation_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.codespace = kCodespace;
  return result;
}

event_attribute_t make_attribute(std::string key,
                                 std::string value,
                                 bool index = false) {
  return event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

}  // namespace

namespace ferry::guard {

timestamp_milliseconds_t system_clock_milliseconds() {
  return static_cast<timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

accommodation_guard::accommodation_guard(
    ferry::storage::storage<ferry::storage::rocksdb_storage_tag>& storage,
    ferry::schema::encoding::encoder<
        ferry::schema::encoding::scale_encoder_tag>& encoder,
    const account_id_t& owner,
    const account_id_t& bridge,
    clock_fn_t clock)
    : storage_{storage},
      encoder_{encoder},
      owner_{owner},
      bridge_{bridge},
      clock_{std::move(clock)} {
  auto lock = std::scoped_lock{mutex_};
  load_persisted_state();
  spdlog::info("Accommodation guard ready with {} configured pair(s)",
               configs_.size());
}

void accommodation_guard::load_persisted_state() {
  auto persisted_bridge = storage_.get<account_id_t>(
      encoder_, make_bytes_view(key::make_guard_bridge_key()));
  if (persisted_bridge) {
    bridge_ = *persisted_bridge;
  }

  auto prefix = key::make_prefix(key::kGuardConfigPrefix);
  for (const auto& [raw_key, raw_value] :
       storage_.list_by_prefix(make_bytes_view(prefix))) {
    auto parsed = key::parse_guard_config_key(make_bytes_view(raw_key));
    if (!parsed) {
      ferry::common::critical("malformed guard config key");
    }
    configs_[*parsed] =
        encoder_.decode<guard_config_t>(make_bytes_view(raw_value));
  }
}

operation_result_t accommodation_guard::require_owner(
    const account_id_t& caller,
    std::string_view action) const {
  if (caller != owner_) {
    spdlog::warn("Rejected guard {}: caller {} is not the owner", action,
                 to_hex(caller));
    return make_failure(error_code_t::missing_role,
                        "caller is not the guard owner");
  }
  return operation_result_t{};
}

operation_result_t accommodation_guard::set_bridge(const account_id_t& caller,
                                                   const account_id_t& bridge) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied = require_owner(caller, "set_bridge"); !denied.ok()) {
    return denied;
  }
  if (is_zero(bridge)) {
    return make_failure(error_code_t::zero_bridge_account,
                        "bridge account is zero");
  }
  auto result = operation_result_t{};
  if (bridge == bridge_) {
    return result;
  }

  auto tx = ferry::storage::transaction{storage_, {this}};
  journal_.track(bridge_);
  result.events.push_back(event_t{
      .type = "set_bridge",
      .attributes = {make_attribute("old_bridge", to_hex(bridge_)),
                     make_attribute("new_bridge", to_hex(bridge), true)}});
  bridge_ = bridge;
  dirty_bridge_ = true;
  tx.commit();
  spdlog::info("Guard bridge set to {}", to_hex(bridge));
  return result;
}

operation_result_t accommodation_guard::configure(
    const account_id_t& caller,
    chain_id_t chain_id,
    const asset_id_t& token,
    duration_milliseconds_t time_frame,
    const amount_t& volume_limit) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied = require_owner(caller, "configure"); !denied.ok()) {
    return denied;
  }
  if (chain_id == 0) {
    return make_failure(error_code_t::zero_chain_id, "chain id is zero");
  }
  if (is_zero(token)) {
    return make_failure(error_code_t::zero_token, "token is zero");
  }
  if (time_frame == 0) {
    return make_failure(error_code_t::zero_time_frame, "time frame is zero");
  }
  if (volume_limit == 0) {
    return make_failure(error_code_t::zero_volume_limit,
                        "volume limit is zero");
  }

  auto tx = ferry::storage::transaction{storage_, {this}};
  auto key = pair_key_t{chain_id, token};
  journal_.track(configs_, key);
  auto [entry, created] = configs_.try_emplace(key);
  auto& config = entry->second;
  if (created) {
    config.current_volume = 0;
    config.last_reset_time = clock_();
  }
  config.time_frame = time_frame;
  config.volume_limit = volume_limit;
  dirty_configs_.insert(key);
  tx.commit();

  spdlog::info("Configured accommodation guard for chain {} token {}: "
               "time frame {} ms, volume limit {}",
               chain_id, to_hex(token), time_frame, to_string(volume_limit));
  auto result = operation_result_t{};
  result.events.push_back(event_t{
      .type = "configure_accommodation_guard",
      .attributes = {make_attribute("chain_id", std::to_string(chain_id), true),
                     make_attribute("token", to_hex(token), true),
                     make_attribute("time_frame", std::to_string(time_frame)),
                     make_attribute("volume_limit", to_string(volume_limit))}});
  return result;
}

operation_result_t accommodation_guard::reset(const account_id_t& caller,
                                              chain_id_t chain_id,
                                              const asset_id_t& token) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied = require_owner(caller, "reset"); !denied.ok()) {
    return denied;
  }
  if (chain_id == 0) {
    return make_failure(error_code_t::zero_chain_id, "chain id is zero");
  }
  if (is_zero(token)) {
    return make_failure(error_code_t::zero_token, "token is zero");
  }

  auto tx = ferry::storage::transaction{storage_, {this}};
  auto key = pair_key_t{chain_id, token};
  journal_.track(configs_, key);
  configs_.erase(key);
  dirty_configs_.insert(key);
  tx.commit();

  spdlog::info("Reset accommodation guard for chain {} token {}", chain_id,
               to_hex(token));
  auto result = operation_result_t{};
  result.events.push_back(event_t{
      .type = "reset_accommodation_guard",
      .attributes = {make_attribute("chain_id", std::to_string(chain_id), true),
                     make_attribute("token", to_hex(token), true)}});
  return result;
}

operation_result_t accommodation_guard::validate(const account_id_t& caller,
                                                 chain_id_t chain_id,
                                                 const asset_id_t& token,
                                                 const account_id_t& account,
                                                 const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  if (caller != bridge_) {
    spdlog::warn("Rejected guard validation from non-bridge {}",
                 to_hex(caller));
    return make_failure(error_code_t::not_bridge,
                        "caller is not the registered bridge");
  }

  auto result = operation_result_t{};
  auto key = pair_key_t{chain_id, token};
  auto found = configs_.find(key);
  if (found == std::end(configs_) || found->second.time_frame == 0) {
    result.guard_status = guard_validation_status_t::time_frame_not_set;
    return result;
  }

  const auto& current = found->second;
  auto now = clock_();
  auto window_elapsed = now >= current.last_reset_time &&
                        now - current.last_reset_time >= current.time_frame;
  auto volume = window_elapsed ? amount_t{0} : current.current_volume;
  if (volume > current.volume_limit ||
      amount > current.volume_limit - volume) {
    spdlog::debug("Guard limit reached for chain {} token {} account {}: "
                  "{} + {} > {}",
                  chain_id, to_hex(token), to_hex(account), to_string(volume),
                  to_string(amount), to_string(current.volume_limit));
    result.guard_status = guard_validation_status_t::volume_limit_reached;
    return result;
  }

  auto tx = ferry::storage::transaction{storage_, {this}};
  journal_.track(configs_, key);
  auto& config = configs_[key];
  if (window_elapsed) {
    config.last_reset_time = now;
  }
  config.current_volume = volume + amount;
  dirty_configs_.insert(key);
  tx.commit();

  result.guard_status = guard_validation_status_t::no_error;
  return result;
}

guard_config_t accommodation_guard::config(chain_id_t chain_id,
                                           const asset_id_t& token) const {
  auto lock = std::scoped_lock{mutex_};
  auto found = configs_.find(pair_key_t{chain_id, token});
  return found == std::end(configs_) ? guard_config_t{} : found->second;
}

account_id_t accommodation_guard::bridge() const {
  auto lock = std::scoped_lock{mutex_};
  return bridge_;
}

void accommodation_guard::begin() {
  mutex_.lock();
  if (depth_++ == 0) {
    journal_.clear();
    dirty_configs_.clear();
    dirty_bridge_ = false;
  }
}

void accommodation_guard::commit(
    std::vector<ferry::storage::key_write_t>& writes) {
  if (--depth_ == 0) {
    for (const auto& [chain_id, token] : dirty_configs_) {
      auto row_key = key::make_guard_config_key(chain_id, token);
      auto found = configs_.find(pair_key_t{chain_id, token});
      if (found == std::end(configs_)) {
        writes.emplace_back(std::move(row_key), std::nullopt);
      } else {
        writes.emplace_back(std::move(row_key), encoder_.encode(found->second));
      }
    }
    if (dirty_bridge_) {
      writes.emplace_back(key::make_guard_bridge_key(), encoder_.encode(bridge_));
    }
    journal_.clear();
    dirty_configs_.clear();
    dirty_bridge_ = false;
  }
  mutex_.unlock();
}

void accommodation_guard::rollback() {
  if (--depth_ == 0) {
    journal_.rollback();
    dirty_configs_.clear();
    dirty_bridge_ = false;
  }
  mutex_.unlock();
}

}  // namespace ferry::guard
