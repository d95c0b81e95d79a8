#pragma once
#include <ferry/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>

// Row keys for every persisted entity. Integers are written little-endian,
// so prefix scans return rows in byte order rather than numeric order.
namespace ferry::schema::key {

inline constexpr auto kRelocationPrefix = std::string_view{"RELOCATION|"};
inline constexpr auto kChainPrefix = std::string_view{"CHAIN|"};
inline constexpr auto kModePrefix = std::string_view{"MODE|"};
inline constexpr auto kLedgerConfigKey = std::string_view{"LEDGER|CONFIG"};
inline constexpr auto kGuardConfigPrefix = std::string_view{"GUARD|CONFIG|"};
inline constexpr auto kGuardBridgeKey = std::string_view{"GUARD|BRIDGE"};

bytes_t make_relocation_key(chain_id_t chain_id, nonce_t nonce);
bytes_t make_chain_key(chain_id_t chain_id);
bytes_t make_mode_key(chain_id_t chain_id, const asset_id_t& token);
bytes_t make_ledger_config_key();
bytes_t make_guard_config_key(chain_id_t chain_id, const asset_id_t& token);
bytes_t make_guard_bridge_key();
bytes_t make_prefix(std::string_view prefix);

std::optional<std::pair<chain_id_t, nonce_t>> parse_relocation_key(
    const bytes_view_t& key);
std::optional<chain_id_t> parse_chain_key(const bytes_view_t& key);
std::optional<std::pair<chain_id_t, asset_id_t>> parse_mode_key(
    const bytes_view_t& key);
std::optional<std::pair<chain_id_t, asset_id_t>> parse_guard_config_key(
    const bytes_view_t& key);

}  // namespace ferry::schema::key
