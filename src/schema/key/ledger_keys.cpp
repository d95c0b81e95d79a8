#include <ferry/schema/key/builder.hpp>
#include <ferry/schema/key/ledger_keys.hpp>

namespace ferry::schema::key {

namespace {

std::optional<std::pair<chain_id_t, asset_id_t>> parse_chain_token(
    const bytes_view_t& key,
    std::string_view prefix) {
  auto in = reader{.data = key};
  if (!in.skip(prefix)) {
    return std::nullopt;
  }
  auto chain_id = in.read<chain_id_t>();
  auto token = in.read_hash32();
  if (!chain_id || !token || !in.done()) {
    return std::nullopt;
  }
  return std::pair{*chain_id, *token};
}

}  // namespace

bytes_t make_relocation_key(chain_id_t chain_id, nonce_t nonce) {
  return builder{}.write(kRelocationPrefix).write(chain_id).write(nonce).data;
}

bytes_t make_chain_key(chain_id_t chain_id) {
  return builder{}.write(kChainPrefix).write(chain_id).data;
}

bytes_t make_mode_key(chain_id_t chain_id, const asset_id_t& token) {
  return builder{}.write(kModePrefix).write(chain_id).write(token).data;
}

bytes_t make_ledger_config_key() {
  return builder{}.write(kLedgerConfigKey).data;
}

bytes_t make_guard_config_key(chain_id_t chain_id, const asset_id_t& token) {
  return builder{}.write(kGuardConfigPrefix).write(chain_id).write(token).data;
}

bytes_t make_guard_bridge_key() {
  return builder{}.write(kGuardBridgeKey).data;
}

bytes_t make_prefix(std::string_view prefix) {
  return builder{}.write(prefix).data;
}

std::optional<std::pair<chain_id_t, nonce_t>> parse_relocation_key(
    const bytes_view_t& key) {
  auto in = reader{.data = key};
  if (!in.skip(kRelocationPrefix)) {
    return std::nullopt;
  }
  auto chain_id = in.read<chain_id_t>();
  auto nonce = in.read<nonce_t>();
  if (!chain_id || !nonce || !in.done()) {
    return std::nullopt;
  }
  return std::pair{*chain_id, *nonce};
}

std::optional<chain_id_t> parse_chain_key(const bytes_view_t& key) {
  auto in = reader{.data = key};
  if (!in.skip(kChainPrefix)) {
    return std::nullopt;
  }
  auto chain_id = in.read<chain_id_t>();
  if (!chain_id || !in.done()) {
    return std::nullopt;
  }
  return chain_id;
}

std::optional<std::pair<chain_id_t, asset_id_t>> parse_mode_key(
    const bytes_view_t& key) {
  return parse_chain_token(key, kModePrefix);
}

std::optional<std::pair<chain_id_t, asset_id_t>> parse_guard_config_key(
    const bytes_view_t& key) {
  return parse_chain_token(key, kGuardConfigPrefix);
}

}  // namespace ferry::schema::key
