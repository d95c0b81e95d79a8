#pragma once
#include <ferry/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace ferry::storage {

using key_value_entry_t =
    std::pair<ferry::schema::bytes_t, ferry::schema::bytes_t>;

/// One staged row change; nullopt deletes the row.
using key_write_t =
    std::pair<ferry::schema::bytes_t, std::optional<ferry::schema::bytes_t>>;

/// Height and state root of the last committed ledger operation.
struct committed_state final {
  uint64_t height{};
  ferry::schema::hash32_t state_root{};
};

template <typename Library>
struct storage {
  /// Decode the row at `key`, or nullopt when it is missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder, const ferry::schema::bytes_view_t& key);

  std::optional<committed_state> load_committed_state() const;

  /// Row that records `state`; staged with the operation it checkpoints.
  key_write_t make_committed_state_write(const committed_state& state) const;

  /// Rows whose key starts with `prefix`, in key order.
  std::vector<key_value_entry_t> list_by_prefix(
      const ferry::schema::bytes_view_t& prefix) const;

  /// Apply every put and delete in one atomic batch.
  void write(const std::vector<key_write_t>& writes) const;
};

/// Open (creating if needed) the backend rooted at `path`.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace ferry::storage
