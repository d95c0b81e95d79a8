#pragma once

#include <ferry/schema/error_code.hpp>
#include <ferry/schema/operation_result.hpp>
#include <ferry/schema/primitives.hpp>
#include <ferry/schema/role_id.hpp>
#include <map>
#include <mutex>
#include <set>

namespace ferry::access {

/// Role membership and the pause flag shared by the ledger entry points.
///
/// The owner role administers every role, including itself. Only pausers may
/// toggle the pause flag.
class access_control final {
 public:
  explicit access_control(const ferry::schema::account_id_t& owner);

  bool has_role(ferry::schema::role_id_t role,
                const ferry::schema::account_id_t& account) const;
  bool paused() const;

  /// `ok` if `account` holds `role`, `missing_role` otherwise.
  ferry::schema::error_code_t authorize(
      const ferry::schema::account_id_t& account,
      ferry::schema::role_id_t role) const;

  /// `ok` unless paused.
  ferry::schema::error_code_t require_not_paused() const;

  ferry::schema::operation_result_t grant_role(
      const ferry::schema::account_id_t& caller,
      ferry::schema::role_id_t role,
      const ferry::schema::account_id_t& account);
  ferry::schema::operation_result_t revoke_role(
      const ferry::schema::account_id_t& caller,
      ferry::schema::role_id_t role,
      const ferry::schema::account_id_t& account);

  ferry::schema::operation_result_t pause(
      const ferry::schema::account_id_t& caller);
  ferry::schema::operation_result_t unpause(
      const ferry::schema::account_id_t& caller);

 private:
  bool has_role_unlocked(ferry::schema::role_id_t role,
                         const ferry::schema::account_id_t& account) const;
  ferry::schema::operation_result_t set_paused(
      const ferry::schema::account_id_t& caller,
      bool paused);

  mutable std::mutex mutex_;
  std::map<ferry::schema::role_id_t, std::set<ferry::schema::account_id_t>>
      members_;
  bool paused_{false};
};

}  // namespace ferry::access
