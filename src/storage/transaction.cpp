#include <spdlog/spdlog.h>
#include <ferry/storage/transaction.hpp>
#include <iterator>

namespace ferry::storage {

transaction::transaction(storage<rocksdb_storage_tag>& storage,
                         std::initializer_list<participant*> participants)
    : storage_{storage} {
  for (auto* item : participants) {
    if (item == nullptr) {
      continue;
    }
    participants_.push_back(item);
    item->begin();
  }
}

transaction::~transaction() {
  if (active_) {
    rollback();
  }
}

void transaction::stage(key_write_t write) {
  extra_writes_.push_back(std::move(write));
}

void transaction::commit() {
  if (!active_) {
    return;
  }
  auto writes = std::vector<key_write_t>{};
  for (auto* item : participants_) {
    item->commit(writes);
  }
  writes.insert(std::end(writes), std::make_move_iterator(std::begin(extra_writes_)),
                std::make_move_iterator(std::end(extra_writes_)));
  active_ = false;
  storage_.write(writes);
  spdlog::debug("Committed transaction with {} row write(s)", writes.size());
}

void transaction::rollback() {
  if (!active_) {
    return;
  }
  for (auto it = std::rbegin(participants_); it != std::rend(participants_);
       ++it) {
    (*it)->rollback();
  }
  extra_writes_.clear();
  active_ = false;
}

}  // namespace ferry::storage
