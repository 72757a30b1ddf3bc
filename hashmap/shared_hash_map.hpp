#pragma once

#include "tracked_hash_map.hpp"
#include <mutex>
#include <shared_mutex>

// TrackedHashMap behind a reader/writer lock. Lookups share the lock; put,
// remove and clear hold it exclusively, which also covers any rehash they
// trigger.
template <typename K, typename V, typename Hash = std::hash<K>>
class SharedHashMap : public AssociativeMap<K, V> {
private:
  TrackedHashMap<K, V, Hash> map;
  mutable std::shared_mutex map_mutex;

public:
  explicit SharedHashMap(const MapConfig &config = MapConfig(),
                         Hash hasher = Hash())
      : map(config, hasher) {}

  std::optional<V> get(const K &key) const override {
    std::shared_lock<std::shared_mutex> lock(map_mutex);
    return map.get(key);
  }

  // The lock is released on return, so the reference is only safe while no
  // other thread can write. With concurrent writers use get() or at_copy().
  const V &at(const K &key) const override {
    std::shared_lock<std::shared_mutex> lock(map_mutex);
    return map.at(key);
  }

  // Copies the value under the shared lock; throws std::out_of_range if key
  // is absent.
  V at_copy(const K &key) const {
    std::shared_lock<std::shared_mutex> lock(map_mutex);
    return map.at(key);
  }

  std::optional<V> put(const K &key, const V &value) override {
    std::unique_lock<std::shared_mutex> lock(map_mutex);
    return map.put(key, value);
  }

  std::optional<V> remove(const K &key) override {
    std::unique_lock<std::shared_mutex> lock(map_mutex);
    return map.remove(key);
  }

  bool contains(const K &key) const override {
    std::shared_lock<std::shared_mutex> lock(map_mutex);
    return map.contains(key);
  }

  size_t size() const override {
    std::shared_lock<std::shared_mutex> lock(map_mutex);
    return map.size();
  }

  void clear() override {
    std::unique_lock<std::shared_mutex> lock(map_mutex);
    map.clear();
  }

  // fn runs under the shared lock and must not call back into this map's
  // writers.
  void for_each(
      const std::function<void(const K &, const V &)> &fn) const override {
    std::shared_lock<std::shared_mutex> lock(map_mutex);
    map.for_each(fn);
  }

  size_t recount() const {
    std::shared_lock<std::shared_mutex> lock(map_mutex);
    return map.recount();
  }

  size_t bucket_count() const {
    std::shared_lock<std::shared_mutex> lock(map_mutex);
    return map.bucket_count();
  }
};
