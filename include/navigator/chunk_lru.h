#pragma once
#ifndef GUTEX_CHUNK_LRU_H
#define GUTEX_CHUNK_LRU_H

#include <cstddef>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>

namespace gutex {

/**
 * @brief Fixed-capacity least-recently-used map.
 *
 * Not synchronized; the owner guards it.
 */
template <typename K, typename V> class LruCache {
public:
  explicit LruCache(std::size_t capacity) : capacity_(capacity) {}

  /** Value for @p key, marking it most recently used. */
  std::optional<V> get(const K &key) {
    auto it = index_.find(key);
    if (it == index_.end())
      return std::nullopt;
    entries_.splice(entries_.begin(), entries_, it->second);
    return it->second->second;
  }

  bool contains(const K &key) const { return index_.count(key) > 0; }

  void put(const K &key, V value) {
    if (capacity_ == 0)
      return;
    auto it = index_.find(key);
    if (it != index_.end()) {
      it->second->second = std::move(value);
      entries_.splice(entries_.begin(), entries_, it->second);
      return;
    }
    entries_.emplace_front(key, std::move(value));
    index_[key] = entries_.begin();
    if (entries_.size() > capacity_) {
      index_.erase(entries_.back().first);
      entries_.pop_back();
    }
  }

  void clear() {
    entries_.clear();
    index_.clear();
  }

  std::size_t size() const { return entries_.size(); }
  std::size_t capacity() const { return capacity_; }

private:
  std::size_t capacity_;
  std::list<std::pair<K, V>> entries_;
  std::unordered_map<K, typename std::list<std::pair<K, V>>::iterator> index_;
};

} // namespace gutex

#endif // GUTEX_CHUNK_LRU_H
