#pragma once

#include <cstdint>

namespace ferry::schema {

enum class error_code_t : uint32_t {
  ok = 0,
  missing_role = 1,
  paused = 2,
  zero_relocation_token = 10,
  zero_relocation_amount = 11,
  unsupported_relocation = 12,
  inappropriate_relocation_status = 13,
  empty_cancellation_batch = 14,
  zero_relocation_count = 15,
  lack_of_pending_relocations = 16,
  relocation_amount_overflow = 17,
  zero_accommodation_nonce = 20,
  accommodation_nonce_mismatch = 21,
  empty_accommodation_batch = 22,
  unsupported_accommodation = 23,
  zero_accommodation_account = 24,
  zero_accommodation_amount = 25,
  accommodation_guard_rejected = 26,
  token_transfer_failure = 30,
  token_burning_failure = 31,
  token_minting_failure = 32,
  non_bridgeable_token = 33,
  unchanged_relocation_mode = 40,
  unchanged_accommodation_mode = 41,
  relocation_mode_is_immutable = 42,
  accommodation_mode_is_immutable = 43,
  unchanged_fee_oracle = 44,
  unchanged_fee_collector = 45,
  unchanged_accommodation_guard = 46,
  not_bridge = 50,
  zero_bridge_account = 51,
  zero_chain_id = 52,
  zero_token = 53,
  zero_time_frame = 54,
  zero_volume_limit = 55,
};

}  // namespace ferry::schema
