#pragma once
#include <ferry/storage/rocksdb/storage.hpp>
#include <ferry/storage/storage.hpp>
#include <initializer_list>
#include <vector>

namespace ferry::storage {

/// Component whose state joins an operation's unit of work.
///
/// `begin` opens a journal (and holds the component for the calling thread
/// until `commit` or `rollback`). `commit` appends the component's dirty rows
/// to `writes` and closes the journal. `rollback` restores every change made
/// since `begin`.
class participant {
 public:
  virtual ~participant() = default;

  virtual void begin() = 0;
  virtual void commit(std::vector<key_write_t>& writes) = 0;
  virtual void rollback() = 0;
};

/// Scoped unit of work spanning several participants.
///
/// Everything staged by the participants lands in one RocksDB write batch on
/// `commit`. A transaction that is destroyed without committing rolls every
/// participant back in reverse order.
class transaction final {
 public:
  transaction(storage<rocksdb_storage_tag>& storage,
              std::initializer_list<participant*> participants);
  ~transaction();

  transaction(const transaction&) = delete;
  transaction& operator=(const transaction&) = delete;

  /// Queue a row that is not owned by any participant.
  void stage(key_write_t write);

  void commit();
  void rollback();

  bool active() const { return active_; }

 private:
  storage<rocksdb_storage_tag>& storage_;
  std::vector<participant*> participants_;
  std::vector<key_write_t> extra_writes_;
  bool active_{true};
};

}  // namespace ferry::storage
