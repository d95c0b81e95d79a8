#pragma once
#include <ferry/schema/primitives.hpp>

// Schema type: guard config.
// Bridge workflow: accommodation volume window for one (chain_id, token)
// pair. A zero time_frame means the pair was never configured.
namespace ferry::schema {

template <uint16_t Version>
struct guard_config;

template <>
struct guard_config<1> final {
  uint16_t version{1};
  duration_milliseconds_t time_frame{};
  amount_t volume_limit{};
  amount_t current_volume{};
  timestamp_milliseconds_t last_reset_time{};
};

using guard_config_t = guard_config<1>;

}  // namespace ferry::schema
