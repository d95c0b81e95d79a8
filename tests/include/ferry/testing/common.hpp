#pragma once

#include <ferry/schema/primitives.hpp>

#include <unistd.h>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace ferry::testing {

/// Distinct non-zero 32-byte id per seed; byte 0 carries the seed.
inline ferry::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = ferry::schema::hash32_t{};
  out[0] = seed;
  out.back() = 0xFE;
  return out;
}

/// Fresh directory name under the system temp dir, unique per process and
/// per call.
inline std::string make_db_path(const std::string_view prefix) {
  static auto sequence = std::atomic<uint64_t>{0};
  auto name = std::string{prefix} + "_" + std::to_string(::getpid()) + "_" +
              std::to_string(sequence.fetch_add(1));
  auto path = std::filesystem::temp_directory_path() / name;
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace ferry::testing
