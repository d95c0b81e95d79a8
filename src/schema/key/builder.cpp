#include <algorithm>
#include <ferry/schema/key/builder.hpp>
#include <iterator>
#include <ranges>

using namespace ferry::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const hash32_t& value) {
  return write(std::span<const uint8_t>{value.data(), value.size()});
}

bool reader::skip(const std::string_view& prefix) {
  if (data.size() < offset + prefix.size()) {
    return false;
  }
  auto head = data.subspan(offset, prefix.size());
  if (!std::ranges::equal(head, prefix, [](uint8_t lhs, char rhs) {
        return lhs == static_cast<uint8_t>(rhs);
      })) {
    return false;
  }
  offset += prefix.size();
  return true;
}

std::optional<ferry::schema::hash32_t> reader::read_hash32() {
  auto value = hash32_t{};
  if (data.size() < offset + value.size()) {
    return std::nullopt;
  }
  std::ranges::copy_n(data.data() + offset, value.size(), std::begin(value));
  offset += value.size();
  return value;
}
