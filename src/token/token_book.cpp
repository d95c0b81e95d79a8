#include <spdlog/spdlog.h>
#include <ferry/token/token_book.hpp>

using namespace ferry::schema;

namespace ferry::token {

bool token_book::move(const asset_id_t& token,
                      const account_id_t& from,
                      const account_id_t& to,
                      const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  auto from_key = balance_key_t{token, from};
  auto found = balances_.find(from_key);
  if (found == std::end(balances_) || found->second < amount) {
    spdlog::warn("Refused transfer of {} {}: insufficient balance of {}",
                 ferry::schema::to_string(amount), to_hex(token), to_hex(from));
    return false;
  }
  auto to_key = balance_key_t{token, to};
  journal_.track(balances_, from_key);
  journal_.track(balances_, to_key);
  balances_[from_key] -= amount;
  balances_[to_key] += amount;
  return true;
}

bool token_book::transfer_in(const asset_id_t& token,
                             const account_id_t& from,
                             const account_id_t& to,
                             const amount_t& amount) {
  return move(token, from, to, amount);
}

bool token_book::transfer_out(const asset_id_t& token,
                              const account_id_t& from,
                              const account_id_t& to,
                              const amount_t& amount) {
  return move(token, from, to, amount);
}

bool token_book::burn(const asset_id_t& token,
                      const account_id_t& from,
                      const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  if (!bridgeable_.contains(token)) {
    return false;
  }
  auto key = balance_key_t{token, from};
  auto found = balances_.find(key);
  if (found == std::end(balances_) || found->second < amount) {
    return false;
  }
  journal_.track(balances_, key);
  journal_.track(supply_, token);
  found->second -= amount;
  supply_[token] -= amount;
  return true;
}

bool token_book::mint(const asset_id_t& token,
                      const account_id_t& to,
                      const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  if (!bridgeable_.contains(token)) {
    return false;
  }
  if (sum_overflows(supply_of(token), amount)) {
    spdlog::warn("Refused mint of {} {}: supply would overflow",
                 ferry::schema::to_string(amount), to_hex(token));
    return false;
  }
  auto key = balance_key_t{token, to};
  journal_.track(balances_, key);
  journal_.track(supply_, token);
  balances_[key] += amount;
  supply_[token] += amount;
  return true;
}

bool token_book::supports_bridge(const asset_id_t& token) {
  auto lock = std::scoped_lock{mutex_};
  return bridgeable_.contains(token);
}

void token_book::begin() {
  mutex_.lock();
  if (depth_++ == 0) {
    journal_.clear();
  }
}

void token_book::commit(std::vector<ferry::storage::key_write_t>&) {
  if (--depth_ == 0) {
    journal_.clear();
  }
  mutex_.unlock();
}

void token_book::rollback() {
  if (--depth_ == 0) {
    journal_.rollback();
  }
  mutex_.unlock();
}

bool token_book::credit(const asset_id_t& token,
                        const account_id_t& account,
                        const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  if (sum_overflows(supply_of(token), amount)) {
    return false;
  }
  balances_[balance_key_t{token, account}] += amount;
  supply_[token] += amount;
  return true;
}

amount_t token_book::supply_of(const asset_id_t& token) const {
  auto found = supply_.find(token);
  return found == std::end(supply_) ? amount_t{0} : found->second;
}

void token_book::set_bridgeable(const asset_id_t& token, bool bridgeable) {
  auto lock = std::scoped_lock{mutex_};
  if (bridgeable) {
    bridgeable_.insert(token);
  } else {
    bridgeable_.erase(token);
  }
}

amount_t token_book::balance_of(const asset_id_t& token,
                                const account_id_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  auto found = balances_.find(balance_key_t{token, account});
  return found == std::end(balances_) ? amount_t{0} : found->second;
}

amount_t token_book::total_supply(const asset_id_t& token) const {
  auto lock = std::scoped_lock{mutex_};
  return supply_of(token);
}

}  // namespace ferry::token
