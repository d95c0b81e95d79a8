#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <ferry/common/critical.hpp>
#include <ferry/schema/encoding/scale/encoder.hpp>
#include <ferry/storage/rocksdb/storage.hpp>
#include <string>
#include <tuple>

namespace {

using encoder_t =
    ferry::schema::encoding::encoder<ferry::schema::encoding::scale_encoder_tag>;
using checkpoint_t = std::tuple<uint64_t, ferry::schema::hash32_t>;

constexpr auto kCommittedStateKey = std::string_view{"SYS|APP|COMMITTED"};

ferry::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  const auto* begin = reinterpret_cast<const uint8_t*>(slice.data());
  return {begin, begin + slice.size()};
}

ROCKSDB_NAMESPACE::Slice to_slice(const ferry::schema::bytes_view_t& bytes) {
  return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

}  // namespace

namespace ferry::storage {

ROCKSDB_NAMESPACE::DB& storage<rocksdb_storage_tag>::open_database() const {
  if (!database) {
    ferry::common::critical("RocksDB database is not open");
  }
  return *database;
}

std::optional<ferry::schema::bytes_t> storage<rocksdb_storage_tag>::read(
    const ferry::schema::bytes_view_t& key) const {
  auto value = std::string{};
  auto status = open_database().Get(ROCKSDB_NAMESPACE::ReadOptions{},
                                    to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    ferry::common::critical("RocksDB read of {} failed: {}",
                            ferry::schema::to_hex(key), status.ToString());
  }
  return ferry::schema::make_bytes(std::string_view{value});
}

std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto raw = read(ferry::schema::make_bytes_view(kCommittedStateKey));
  if (!raw) {
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto decoded =
      encoder.try_decode<checkpoint_t>(ferry::schema::make_bytes_view(*raw));
  if (!decoded) {
    ferry::common::critical("committed state row of {} byte(s) is corrupt",
                            raw->size());
  }
  return committed_state{.height = std::get<0>(*decoded),
                         .state_root = std::get<1>(*decoded)};
}

key_write_t storage<rocksdb_storage_tag>::make_committed_state_write(
    const committed_state& state) const {
  auto encoder = encoder_t{};
  return key_write_t{ferry::schema::make_bytes(kCommittedStateKey),
                     encoder.encode(checkpoint_t{state.height, state.state_root})};
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const ferry::schema::bytes_view_t& prefix) const {
  auto entries = std::vector<key_value_entry_t>{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      open_database().NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  auto prefix_slice = to_slice(prefix);
  for (iterator->Seek(prefix_slice);
       iterator->Valid() && iterator->key().starts_with(prefix_slice);
       iterator->Next()) {
    entries.emplace_back(to_bytes(iterator->key()), to_bytes(iterator->value()));
  }
  if (!iterator->status().ok()) {
    ferry::common::critical("RocksDB scan of prefix {} failed: {}",
                            ferry::schema::to_hex(prefix),
                            iterator->status().ToString());
  }
  return entries;
}

void storage<rocksdb_storage_tag>::write(
    const std::vector<key_write_t>& writes) const {
  if (writes.empty()) {
    return;
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : writes) {
    auto key_slice = to_slice(ferry::schema::make_bytes_view(key));
    auto status =
        value ? batch.Put(key_slice,
                          to_slice(ferry::schema::make_bytes_view(*value)))
              : batch.Delete(key_slice);
    if (!status.ok()) {
      ferry::common::critical(
          "Staging row {} failed: {}",
          ferry::schema::to_hex(ferry::schema::make_bytes_view(key)),
          status.ToString());
    }
  }

  auto status =
      open_database().Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!status.ok()) {
    ferry::common::critical("RocksDB batch of {} row(s) failed: {}",
                            writes.size(), status.ToString());
  }
  spdlog::debug("Wrote batch of {} row(s)", writes.size());
}

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* raw{nullptr};
  auto status = ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &raw);
  if (!status.ok()) {
    ferry::common::critical("Opening RocksDB at {} failed: {}", path,
                            status.ToString());
  }
  spdlog::info("Opened RocksDB at {}", path);

  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(raw);
  return store;
}

}  // namespace ferry::storage
