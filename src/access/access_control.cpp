#include <spdlog/spdlog.h>
#include <ferry/access/access_control.hpp>
#include <string>

using namespace ferry::schema;

namespace {

constexpr auto kCodespace = "ferry.access";

operation_result_t make_failure(error_code_t code, std::string log) {
  auto result = operation_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.codespace = kCodespace;
  return result;
}

event_t make_role_event(std::string type,
                        role_id_t role,
                        const account_id_t& account,
                        const account_id_t& sender) {
  return event_t{
      .type = std::move(type),
      .attributes = {
          event_attribute_t{.key = "role",
                            .value = std::string{to_string(role)},
                            .index = true},
          event_attribute_t{
              .key = "account", .value = to_hex(account), .index = true},
          event_attribute_t{
              .key = "sender", .value = to_hex(sender), .index = false}}};
}

}  // namespace

namespace ferry::access {

access_control::access_control(const account_id_t& owner) {
  members_[role_id_t::owner].insert(owner);
}

bool access_control::has_role_unlocked(role_id_t role,
                                       const account_id_t& account) const {
  auto found = members_.find(role);
  return found != std::end(members_) && found->second.contains(account);
}

bool access_control::has_role(role_id_t role,
                              const account_id_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  return has_role_unlocked(role, account);
}

bool access_control::paused() const {
  auto lock = std::scoped_lock{mutex_};
  return paused_;
}

error_code_t access_control::authorize(const account_id_t& account,
                                       role_id_t role) const {
  return has_role(role, account) ? error_code_t::ok
                                 : error_code_t::missing_role;
}

error_code_t access_control::require_not_paused() const {
  return paused() ? error_code_t::paused : error_code_t::ok;
}

operation_result_t access_control::grant_role(const account_id_t& caller,
                                              role_id_t role,
                                              const account_id_t& account) {
  auto lock = std::scoped_lock{mutex_};
  if (!has_role_unlocked(role_id_t::owner, caller)) {
    spdlog::warn("Rejected grant of role '{}': caller {} is not an owner",
                 to_string(role), to_hex(caller));
    return make_failure(error_code_t::missing_role,
                        "caller does not hold the owner role");
  }
  auto result = operation_result_t{};
  if (members_[role].insert(account).second) {
    result.events.push_back(make_role_event("grant_role", role, account, caller));
    spdlog::info("Granted role '{}' to {}", to_string(role), to_hex(account));
  }
  return result;
}

operation_result_t access_control::revoke_role(const account_id_t& caller,
                                               role_id_t role,
                                               const account_id_t& account) {
  auto lock = std::scoped_lock{mutex_};
  if (!has_role_unlocked(role_id_t::owner, caller)) {
    spdlog::warn("Rejected revocation of role '{}': caller {} is not an owner",
                 to_string(role), to_hex(caller));
    return make_failure(error_code_t::missing_role,
                        "caller does not hold the owner role");
  }
  auto result = operation_result_t{};
  if (members_[role].erase(account) > 0) {
    result.events.push_back(
        make_role_event("revoke_role", role, account, caller));
    spdlog::info("Revoked role '{}' from {}", to_string(role), to_hex(account));
  }
  return result;
}

operation_result_t access_control::pause(const account_id_t& caller) {
  return set_paused(caller, true);
}

operation_result_t access_control::unpause(const account_id_t& caller) {
  return set_paused(caller, false);
}

operation_result_t access_control::set_paused(const account_id_t& caller,
                                              bool paused) {
  auto lock = std::scoped_lock{mutex_};
  if (!has_role_unlocked(role_id_t::pauser, caller)) {
    return make_failure(error_code_t::missing_role,
                        "caller does not hold the pauser role");
  }
  auto result = operation_result_t{};
  if (paused_ == paused) {
    return result;
  }
  paused_ = paused;
  spdlog::info("Ledger {} by {}", paused ? "paused" : "unpaused",
               to_hex(caller));
  result.events.push_back(event_t{
      .type = paused ? "pause" : "unpause",
      .attributes = {event_attribute_t{
          .key = "account", .value = to_hex(caller), .index = true}}});
  return result;
}

}  // namespace ferry::access
