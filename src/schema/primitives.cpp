#include <ferry/schema/primitives.hpp>

#include <algorithm>
#include <charconv>
#include <iterator>
#include <limits>

namespace ferry::schema {

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes.data(), bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{std::begin(bytes), std::end(bytes)};
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  auto digits = hex;
  if (digits.starts_with("0x") || digits.starts_with("0X")) {
    digits.remove_prefix(2);
  }
  auto hash = hash32_t{};
  if (digits.size() != hash.size() * 2) {
    return std::nullopt;
  }
  for (std::size_t i = 0; i < hash.size(); ++i) {
    const auto* first = digits.data() + (2 * i);
    auto [end, error] = std::from_chars(first, first + 2, hash[i], 16);
    if (error != std::errc{} || end != first + 2) {
      return std::nullopt;
    }
  }
  return hash;
}

hash32_t make_zero_hash() { return hash32_t{}; }

bool is_zero(const hash32_t& value) {
  return std::ranges::all_of(value, [](const uint8_t b) { return b == 0; });
}

bool sum_overflows(const amount_t& lhs, const amount_t& rhs) {
  return rhs > std::numeric_limits<amount_t>::max() - lhs;
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kDigits = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  for (const auto byte : bytes) {
    out.push_back(kDigits[byte >> 4u]);
    out.push_back(kDigits[byte & 0x0Fu]);
  }
  return out;
}

std::string to_hex(const hash32_t& value) {
  return to_hex(bytes_view_t{value.data(), value.size()});
}

std::string to_string(const amount_t& value) { return value.str(); }

}  // namespace ferry::schema
