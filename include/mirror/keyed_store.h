#pragma once
#ifndef GUTEX_KEYED_STORE_H
#define GUTEX_KEYED_STORE_H

#include <array>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace gutex {

/**
 * @brief String-keyed map with one lock per stripe of keys.
 *
 * Writers touching different keys usually land on different stripes and
 * do not contend. There is no global lock; snapshot() visits the stripes
 * one after another.
 *
 * @tparam V Value type, default constructible for update().
 * @tparam Stripes Number of independently locked shards.
 */
template <typename V, std::size_t Stripes = 16> class KeyedStore {
public:
  /**
   * @brief Get-or-create the value for @p key and apply @p fn to it while
   * the key's stripe is locked.
   * @return Copy of the value after @p fn ran.
   */
  template <typename F> V update(const std::string &key, F &&fn) {
    Stripe &s = stripeFor(key);
    std::lock_guard<std::mutex> lock(s.mutex);
    V &value = s.map[key];
    fn(value);
    return value;
  }

  std::optional<V> get(const std::string &key) const {
    const Stripe &s = stripeFor(key);
    std::lock_guard<std::mutex> lock(s.mutex);
    auto it = s.map.find(key);
    if (it == s.map.end())
      return std::nullopt;
    return it->second;
  }

  void set(const std::string &key, V value) {
    Stripe &s = stripeFor(key);
    std::lock_guard<std::mutex> lock(s.mutex);
    s.map[key] = std::move(value);
  }

  /** @return true when an entry was removed. */
  bool erase(const std::string &key) {
    Stripe &s = stripeFor(key);
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.map.erase(key) > 0;
  }

  std::size_t size() const {
    std::size_t total = 0;
    for (const auto &s : stripes_) {
      std::lock_guard<std::mutex> lock(s.mutex);
      total += s.map.size();
    }
    return total;
  }

  std::unordered_map<std::string, V> snapshot() const {
    std::unordered_map<std::string, V> out;
    for (const auto &s : stripes_) {
      std::lock_guard<std::mutex> lock(s.mutex);
      out.insert(s.map.begin(), s.map.end());
    }
    return out;
  }

  void clear() {
    for (auto &s : stripes_) {
      std::lock_guard<std::mutex> lock(s.mutex);
      s.map.clear();
    }
  }

private:
  struct Stripe {
    mutable std::mutex mutex;
    std::unordered_map<std::string, V> map;
  };

  Stripe &stripeFor(const std::string &key) {
    return stripes_[std::hash<std::string>{}(key) % Stripes];
  }
  const Stripe &stripeFor(const std::string &key) const {
    return stripes_[std::hash<std::string>{}(key) % Stripes];
  }

  std::array<Stripe, Stripes> stripes_;
};

} // namespace gutex

#endif // GUTEX_KEYED_STORE_H
