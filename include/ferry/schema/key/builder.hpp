#pragma once
#include <boost/endian/conversion.hpp>
#include <ferry/schema/primitives.hpp>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string_view>
#include <type_traits>

namespace ferry::schema::key {

struct builder final {
  ferry::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
  builder& write(const hash32_t& value);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    auto little = boost::endian::native_to_little(value);
    auto offset = data.size();
    data.resize(offset + sizeof(T));
    std::memcpy(data.data() + offset, &little, sizeof(T));
    return *this;
  }
};

/// Sequential reader over a key produced by `builder`.
struct reader final {
  ferry::schema::bytes_view_t data;
  size_t offset{};

  /// Consume `prefix`; false when the key does not start with it.
  bool skip(const std::string_view& prefix);
  std::optional<hash32_t> read_hash32();

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  std::optional<T> read() {
    if (data.size() < offset + sizeof(T)) {
      return std::nullopt;
    }
    auto value = T{};
    std::memcpy(&value, data.data() + offset, sizeof(T));
    offset += sizeof(T);
    return boost::endian::little_to_native(value);
  }

  bool done() const { return offset == data.size(); }
};

}  // namespace ferry::schema::key
