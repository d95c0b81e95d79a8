#include <ferry/schema/encoding/scale/encoder.hpp>
#include <ferry/storage/rocksdb/storage.hpp>
#include <ferry/storage/storage.hpp>
#include <ferry/storage/transaction.hpp>
#include <ferry/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

namespace {

using encoder_t =
    ferry::schema::encoding::encoder<ferry::schema::encoding::scale_encoder_tag>;

/// Participant that stages one fixed row and records its lifecycle.
class recording_participant final : public ferry::storage::participant {
 public:
  explicit recording_participant(ferry::storage::key_write_t row)
      : row_{std::move(row)} {}

  void begin() override { ++begins; }
  void commit(std::vector<ferry::storage::key_write_t>& writes) override {
    ++commits;
    writes.push_back(row_);
  }
  void rollback() override { ++rollbacks; }

  int begins{};
  int commits{};
  int rollbacks{};

 private:
  ferry::storage::key_write_t row_;
};

}  // namespace

TEST(storage_types, defaults_are_stable) {
  auto committed = ferry::storage::committed_state{};
  EXPECT_EQ(committed.height, 0u);
  EXPECT_TRUE(ferry::schema::is_zero(committed.state_root));

  auto entry = ferry::storage::key_value_entry_t{};
  EXPECT_TRUE(entry.first.empty());
  EXPECT_TRUE(entry.second.empty());
}

TEST(storage_types, committed_state_round_trips) {
  auto db = ferry::testing::make_db_path("ferry_storage_committed");
  {
    auto storage =
        ferry::storage::make_storage<ferry::storage::rocksdb_storage_tag>(db);
    EXPECT_FALSE(storage.load_committed_state().has_value());

    auto state = ferry::storage::committed_state{
        .height = 42, .state_root = ferry::testing::make_hash(10)};
    storage.write({storage.make_committed_state_write(state)});

    auto loaded = storage.load_committed_state();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->height, state.height);
    EXPECT_EQ(loaded->state_root, state.state_root);
  }
  ferry::testing::remove_path(db);
}

TEST(storage_types, write_batch_applies_puts_and_deletes) {
  auto db = ferry::testing::make_db_path("ferry_storage_batch");
  {
    auto storage =
        ferry::storage::make_storage<ferry::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto first = ferry::schema::make_bytes(std::string_view{"ROW|1"});
    auto second = ferry::schema::make_bytes(std::string_view{"ROW|2"});
    storage.write({{first, encoder.encode(uint64_t{1})}});
    ASSERT_TRUE(storage
                    .get<uint64_t>(encoder,
                                   ferry::schema::make_bytes_view(first))
                    .has_value());

    storage.write({{first, std::nullopt}, {second, encoder.encode(uint64_t{2})}});

    EXPECT_FALSE(storage
                     .get<uint64_t>(encoder,
                                    ferry::schema::make_bytes_view(first))
                     .has_value());
    EXPECT_EQ(storage.get<uint64_t>(encoder,
                                    ferry::schema::make_bytes_view(second)),
              std::optional<uint64_t>{2});
  }
  ferry::testing::remove_path(db);
}

TEST(storage_types, list_by_prefix_stops_at_prefix_boundary) {
  auto db = ferry::testing::make_db_path("ferry_storage_prefix");
  {
    auto storage =
        ferry::storage::make_storage<ferry::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto rows = std::vector<ferry::storage::key_write_t>{};
    for (auto key : {"A|1", "A|2", "B|1"}) {
      rows.emplace_back(ferry::schema::make_bytes(std::string_view{key}),
                        encoder.encode(uint32_t{7}));
    }
    storage.write(rows);
    auto entries = storage.list_by_prefix(
        ferry::schema::make_bytes_view(std::string_view{"A|"}));
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(ferry::schema::make_string(
                  ferry::schema::make_bytes_view(entries[0].first)),
              "A|1");
  }
  ferry::testing::remove_path(db);
}

TEST(storage_types, transaction_commit_persists_participant_rows) {
  auto db = ferry::testing::make_db_path("ferry_storage_tx_commit");
  {
    auto storage =
        ferry::storage::make_storage<ferry::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto key = ferry::schema::make_bytes(std::string_view{"TX|ROW"});
    auto participant =
        recording_participant{{key, encoder.encode(uint64_t{5})}};
    {
      auto tx = ferry::storage::transaction{storage, {&participant, nullptr}};
      tx.commit();
      EXPECT_FALSE(tx.active());
    }
    EXPECT_EQ(participant.begins, 1);
    EXPECT_EQ(participant.commits, 1);
    EXPECT_EQ(participant.rollbacks, 0);
    EXPECT_EQ(
        storage.get<uint64_t>(encoder, ferry::schema::make_bytes_view(key)),
        std::optional<uint64_t>{5});
  }
  ferry::testing::remove_path(db);
}

TEST(storage_types, transaction_rolls_back_when_abandoned) {
  auto db = ferry::testing::make_db_path("ferry_storage_tx_rollback");
  {
    auto storage =
        ferry::storage::make_storage<ferry::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto key = ferry::schema::make_bytes(std::string_view{"TX|ROW"});
    auto participant =
        recording_participant{{key, encoder.encode(uint64_t{5})}};
    {
      auto tx = ferry::storage::transaction{storage, {&participant}};
      tx.stage({ferry::schema::make_bytes(std::string_view{"TX|EXTRA"}),
                encoder.encode(uint64_t{6})});
    }
    EXPECT_EQ(participant.rollbacks, 1);
    EXPECT_EQ(participant.commits, 0);
    EXPECT_FALSE(
        storage.get<uint64_t>(encoder, ferry::schema::make_bytes_view(key))
            .has_value());
  }
  ferry::testing::remove_path(db);
}
