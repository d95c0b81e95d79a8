#pragma once

#include <functional>
#include <utility>
#include <vector>

namespace ferry::common {

/// Journal of restore actions for in-memory state touched by an open
/// transaction. `rollback` replays them newest first.
class undo_log final {
 public:
  void record(std::function<void()> restore) {
    entries_.push_back(std::move(restore));
  }

  /// Remember the current value of `value`.
  template <typename T>
  void track(T& value) {
    record([&value, previous = value]() mutable { value = std::move(previous); });
  }

  /// Remember the current entry (or absence) of `key` in `map`.
  template <typename Map>
  void track(Map& map, const typename Map::key_type& key) {
    auto found = map.find(key);
    if (found == std::end(map)) {
      record([&map, key]() { map.erase(key); });
    } else {
      record([&map, key, previous = found->second]() {
        map.insert_or_assign(key, previous);
      });
    }
  }

  void rollback() {
    while (!entries_.empty()) {
      auto restore = std::move(entries_.back());
      entries_.pop_back();
      restore();
    }
  }

  void clear() { entries_.clear(); }
  bool empty() const { return entries_.empty(); }
  std::size_t size() const { return entries_.size(); }

 private:
  std::vector<std::function<void()>> entries_;
};

}  // namespace ferry::common
