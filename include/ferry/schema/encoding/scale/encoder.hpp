#pragma once
#include <ferry/common/critical.hpp>
#include <ferry/schema/encoding/encoder.hpp>
#include <ferry/schema/encoding/scale/chain_counters.hpp>
#include <ferry/schema/encoding/scale/enums.hpp>
#include <ferry/schema/encoding/scale/event.hpp>
#include <ferry/schema/encoding/scale/guard_config.hpp>
#include <ferry/schema/encoding/scale/ledger_config.hpp>
#include <ferry/schema/encoding/scale/relocation.hpp>
#include <ferry/schema/encoding/scale/token_modes.hpp>
#include <optional>
#include <scale/scale.hpp>
#include <utility>

namespace ferry::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  ferry::schema::bytes_t encode(const T& obj) {
    auto encoded = ::scale::impl::memory::encode(obj);
    if (!encoded) {
      ferry::common::critical("SCALE encoding failed: {}",
                              encoded.error().message());
    }
    return std::move(encoded.value());
  }

  template <typename T>
  T decode(const ferry::schema::bytes_view_t& bytes) {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      ferry::common::critical("SCALE decoding of {} byte(s) failed: {}",
                              bytes.size(), decoded.error().message());
    }
    return std::move(decoded.value());
  }

  template <typename T>
  std::optional<T> try_decode(const ferry::schema::bytes_view_t& bytes) {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      return std::nullopt;
    }
    return std::move(decoded.value());
  }
};

}  // namespace ferry::schema::encoding
