#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <utility>
#include <vector>

/*
    ConcurrentMap is the keyed state container shared between the analytics worker and the reporting path.

    Contract: single writer, many readers.
    - The analytics worker is the only thread that calls the mutating methods (upsert/update/erase/clear).
    - Any thread may call the read methods (get/contains/snapshot/size) while the worker is writing.

    Writes take the exclusive lock, reads take the shared lock, so a reader sees each value either before or after
    a write, never half of one. Reads of different keys are not taken atomically together, a snapshot() is the only
    way to see several keys from the same instant.
*/

namespace fta {

template <typename K, typename V>
class ConcurrentMap {
public:
  ConcurrentMap() = default;

  ConcurrentMap(const ConcurrentMap&) = delete;
  ConcurrentMap& operator=(const ConcurrentMap&) = delete;

  // Writer side

  void upsert(const K& key, V value) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    map_[key] = std::move(value);
  }

  // Mutate the value for key in place, default constructing it first if absent. Returns fn's result
  template <typename Fn>
  auto update(const K& key, Fn&& fn) -> decltype(fn(std::declval<V&>())) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    return fn(map_[key]);
  }

  bool erase(const K& key) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    return map_.erase(key) > 0;
  }

  // Erase every entry for which pred(key, value) is true, returns number erased
  template <typename Pred>
  std::size_t erase_if(Pred&& pred) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    std::size_t erased = 0;
    for (auto it = map_.begin(); it != map_.end();) {
      if (pred(it->first, it->second)) {
        it = map_.erase(it);
        ++erased;
      } else {
        ++it;
      }
    }
    return erased;
  }

  void clear() {
    std::unique_lock<std::shared_mutex> lock(mu_);
    map_.clear();
  }

  // Reader side

  std::optional<V> get(const K& key) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto it = map_.find(key);
    if (it == map_.end()) return std::nullopt;
    return it->second;
  }

  bool contains(const K& key) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return map_.find(key) != map_.end();
  }

  std::map<K, V> snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return map_;
  }

  std::vector<K> keys() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    std::vector<K> out;
    out.reserve(map_.size());
    for (const auto& kv : map_) out.push_back(kv.first);
    return out;
  }

  std::size_t size() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return map_.size();
  }

private:
  mutable std::shared_mutex mu_;
  std::map<K, V> map_;
};

} // namespace fta
