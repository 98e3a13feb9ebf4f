// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <utility>

namespace bitwire {
namespace util {

/**
 * ThreadSafeMap - ordered map guarded by an internal mutex
 *
 * All access goes through callbacks that run with the lock held, so a
 * caller never holds a reference into the map after the lock is released.
 * Callbacks must not call back into the same map (the mutex is not recursive).
 */
template <typename K, typename V>
class ThreadSafeMap {
public:
  // Insert only if absent; returns false if the key already exists
  bool Insert(const K& key, V value) {
    std::lock_guard<std::mutex> lock(mutex_);
    return map_.emplace(key, std::move(value)).second;
  }

  bool Erase(const K& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return map_.erase(key) > 0;
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return map_.size();
  }

  // Invoke fn(const V&) if key exists; returns whether it was found
  template <typename Fn>
  bool Read(const K& key, Fn&& fn) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end()) {
      return false;
    }
    fn(it->second);
    return true;
  }

  // Invoke fn(const K&, const V&) for every entry in key order
  template <typename Fn>
  void ForEach(Fn&& fn) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, value] : map_) {
      fn(key, value);
    }
  }

private:
  mutable std::mutex mutex_;
  std::map<K, V> map_;
};

}  // namespace util
}  // namespace bitwire
