#pragma once

#include "maestro/core/error.hpp"

#include <concepts>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace maestro {

// Read-mostly concurrent map. Values are expected to be cheap to copy
// (shared_ptr handles); every accessor returns copies so no reference into
// the map escapes the lock.
template <typename K, typename V, typename Hash = std::hash<K>,
          typename KeyEqual = std::equal_to<K>>
  requires std::copyable<K> && std::copyable<V>
class ConcurrentMap {
public:
  using map_type = std::unordered_map<K, V, Hash, KeyEqual>;

  ConcurrentMap() = default;
  ~ConcurrentMap() = default;

  ConcurrentMap(const ConcurrentMap&) = delete;
  auto operator=(const ConcurrentMap&) -> ConcurrentMap& = delete;

  auto store(K key, V value) -> void {
    std::unique_lock lock(mu_);
    map_.insert_or_assign(std::move(key), std::move(value));
  }

  // Inserts only if absent. Returns false if the key was already present.
  [[nodiscard]] auto try_store(K key, V value) -> bool {
    std::unique_lock lock(mu_);
    return map_.try_emplace(std::move(key), std::move(value)).second;
  }

  template <typename Key>
  [[nodiscard]] auto load(const Key& key) const -> std::optional<V> {
    std::shared_lock lock(mu_);
    auto it = map_.find(key);
    if (it == map_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  template <typename Key>
  [[nodiscard]] auto contains(const Key& key) const -> bool {
    std::shared_lock lock(mu_);
    return map_.find(key) != map_.end();
  }

  // Returns true if an entry was removed.
  template <typename Key>
  auto erase(const Key& key) -> bool {
    std::unique_lock lock(mu_);
    auto it = map_.find(key);
    if (it == map_.end()) {
      return false;
    }
    map_.erase(it);
    return true;
  }

  // Visits a point-in-time snapshot; the visitor runs without the map lock
  // held and may therefore call back into the map. Returning false stops the
  // iteration.
  template <typename F>
    requires std::predicate<F&, const K&, const V&>
  auto range(F&& visit) const -> void {
    for (const auto& [key, value] : snapshot()) {
      if (!std::invoke(visit, key, value)) {
        return;
      }
    }
  }

  [[nodiscard]] auto keys() const -> std::vector<K> {
    std::shared_lock lock(mu_);
    std::vector<K> result;
    result.reserve(map_.size());
    for (const auto& [key, _] : map_) {
      result.push_back(key);
    }
    return result;
  }

  [[nodiscard]] auto values() const -> std::vector<V> {
    std::shared_lock lock(mu_);
    std::vector<V> result;
    result.reserve(map_.size());
    for (const auto& [_, value] : map_) {
      result.push_back(value);
    }
    return result;
  }

  [[nodiscard]] auto pairs() const -> map_type {
    std::shared_lock lock(mu_);
    return map_;
  }

  [[nodiscard]] auto size() const -> std::size_t {
    std::shared_lock lock(mu_);
    return map_.size();
  }

  [[nodiscard]] auto empty() const -> bool {
    return size() == 0;
  }

  auto clear() -> void {
    std::unique_lock lock(mu_);
    map_.clear();
  }

private:
  [[nodiscard]] auto snapshot() const -> std::vector<std::pair<K, V>> {
    std::shared_lock lock(mu_);
    return {map_.begin(), map_.end()};
  }

  mutable std::shared_mutex mu_;
  map_type map_;
};

template <typename V>
using StringMap = ConcurrentMap<std::string, V, StringHash, StringEqual>;

}  // namespace maestro
