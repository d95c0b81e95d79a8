#pragma once
#include <rocksdb/db.h>
#include <ferry/storage/storage.hpp>
#include <memory>
#include <optional>
#include <string_view>

namespace ferry::storage {

struct rocksdb_storage_tag {};

/// RocksDB backend. Values are opaque encoded bytes; every mutation goes
/// through `write` so a ledger operation lands in a single WriteBatch.
template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const ferry::schema::bytes_view_t& key) {
    auto raw = read(key);
    if (!raw) {
      return std::nullopt;
    }
    return encoder.template decode<T>(ferry::schema::make_bytes_view(*raw));
  }

  /// Raw row at `key`; storage errors other than NotFound are fatal.
  std::optional<ferry::schema::bytes_t> read(
      const ferry::schema::bytes_view_t& key) const;

  std::optional<committed_state> load_committed_state() const;
  key_write_t make_committed_state_write(const committed_state& state) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const ferry::schema::bytes_view_t& prefix) const;
  void write(const std::vector<key_write_t>& writes) const;

 private:
  ROCKSDB_NAMESPACE::DB& open_database() const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

}  // namespace ferry::storage
