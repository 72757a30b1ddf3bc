#pragma once

#include "bucketed_map.hpp"
#include <iostream>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <utility>

// BucketedMap that doubles its bucket count once the load factor is exceeded.
// The growth check reads the summed size, so every put scans all buckets and
// n inserts cost O(n^2) overall. TrackedHashMap removes that scan.
template <typename K, typename V, typename Hash = std::hash<K>>
class GrowableHashMap : public AssociativeMap<K, V> {
private:
  BucketedMap<K, V, Hash> buckets;
  float max_load_factor;

public:
  explicit GrowableHashMap(const MapConfig &config = MapConfig(),
                           Hash hasher = Hash())
      : buckets(config.validate().bucket_count, hasher),
        max_load_factor(config.load_factor) {}

  bool over_threshold(size_t num_elements) const {
    return static_cast<double>(num_elements) >
           static_cast<double>(buckets.bucket_count()) * max_load_factor;
  }

  // Smallest doubling of the current bucket count that holds num_elements
  // within the load factor. Throws std::length_error if the count would wrap.
  size_t growth_target(size_t num_elements) const {
    size_t target = buckets.bucket_count();
    while (static_cast<double>(num_elements) >
           static_cast<double>(target) * max_load_factor) {
      if (target > std::numeric_limits<size_t>::max() / 2) {
        throw std::length_error("bucket count overflow");
      }
      target *= 2;
    }
    return target;
  }

  // Copies every entry into a bucket array of new_size buckets and returns
  // the number of entries moved. Uses bucket-level put only. The old buckets
  // are left untouched until the final move, so a throw changes nothing.
  size_t rehash(size_t new_size) {
    BucketedMap<K, V, Hash> new_buckets(new_size, buckets.hash_function());
    new_buckets.stats() = buckets.stats();

    size_t moved = 0;
    for (size_t i = 0; i < buckets.bucket_count(); i++) {
      for (const auto &entry : buckets.bucket(i)) {
        new_buckets.bucket_for(entry.first).put(entry.first, entry.second);
        moved++;
      }
    }

    new_buckets.stats().rehashes.fetch_add(1, std::memory_order_relaxed);
    new_buckets.stats().migrated.fetch_add(moved, std::memory_order_relaxed);
    buckets = std::move(new_buckets);
    return moved;
  }

  size_t rehash() { return rehash(buckets.bucket_count() * 2); }

  std::optional<V> get(const K &key) const override {
    return buckets.get(key);
  }

  const V &at(const K &key) const override { return buckets.at(key); }

  std::optional<V> put(const K &key, const V &value) override {
    std::optional<V> previous = buckets.put(key, value);
    size_t num_elements = buckets.size();
    if (over_threshold(num_elements)) {
      try {
        rehash(growth_target(num_elements));
      } catch (...) {
        // an overwrite never changes the size, so only a new key gets here;
        // it is still the last entry of its bucket in the old table
        buckets.bucket_for(key).drop_last(key);
        throw;
      }
    }
    return previous;
  }

  std::optional<V> remove(const K &key) override {
    return buckets.remove(key);
  }

  bool contains(const K &key) const override {
    return buckets.contains(key);
  }

  size_t size() const override { return buckets.size(); }

  void clear() override { buckets.clear(); }

  void for_each(
      const std::function<void(const K &, const V &)> &fn) const override {
    buckets.for_each(fn);
  }

  size_t bucket_count() const { return buckets.bucket_count(); }
  float load_factor() const { return max_load_factor; }

  BucketedMap<K, V, Hash> &table() { return buckets; }
  const BucketedMap<K, V, Hash> &table() const { return buckets; }

  const MapStats &stats() const { return buckets.stats(); }
  void reset_stats() { buckets.stats().reset(); }

  // for debugging purposes
  void display(std::ostream &os = std::cerr, size_t max_buckets = 16) const {
    os << "Load factor threshold: " << max_load_factor << std::endl;
    buckets.display(os, max_buckets);
  }
};
