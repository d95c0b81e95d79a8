#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ferry::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using account_id_t = hash32_t;
using asset_id_t = hash32_t;
using amount_t = boost::multiprecision::uint256_t;
using chain_id_t = uint64_t;
using nonce_t = uint64_t;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_view_t& bytes);

/// Parse 64 hex digits (optionally 0x-prefixed) into a hash.
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();
bool is_zero(const hash32_t& value);

/// True when `lhs + rhs` does not fit in `amount_t`.
bool sum_overflows(const amount_t& lhs, const amount_t& rhs);

/// Lower-case hex without prefix.
std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& value);

/// Decimal rendering used in events and logs.
std::string to_string(const amount_t& value);

}  // namespace ferry::schema
