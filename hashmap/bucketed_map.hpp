#pragma once

#include "linear_map.hpp"
#include "map_config.hpp"
#include "map_stats.hpp"
#include <functional>
#include <iostream>
#include <ostream>
#include <stdexcept>
#include <vector>

// Fixed array of LinearMap buckets. Every operation is routed to the bucket
// chosen by hash(key) % bucket_count.
template <typename K, typename V, typename Hash = std::hash<K>>
class BucketedMap : public AssociativeMap<K, V> {
private:
  using Bucket = LinearMap<K, V>;
  std::vector<Bucket> buckets;
  Hash hasher;
  mutable MapStats counters;

  void count_bucket_op() const {
    counters.bucket_ops.fetch_add(1, std::memory_order_relaxed);
  }

public:
  explicit BucketedMap(size_t bucket_count = DEFAULT_BUCKET_COUNT,
                       Hash hasher = Hash())
      : hasher(hasher) {
    if (bucket_count == 0) {
      throw std::invalid_argument("bucket count must be at least 1");
    }
    buckets.resize(bucket_count);
  }

  // Depends only on the key and the current bucket count.
  size_t choose_map(const K &key) const {
    return hasher(key) % buckets.size();
  }

  size_t bucket_count() const { return buckets.size(); }

  Bucket &bucket(size_t index) { return buckets[index]; }
  const Bucket &bucket(size_t index) const { return buckets[index]; }

  Bucket &bucket_for(const K &key) { return buckets[choose_map(key)]; }
  const Bucket &bucket_for(const K &key) const {
    return buckets[choose_map(key)];
  }

  const Hash &hash_function() const { return hasher; }

  std::optional<V> get(const K &key) const override {
    count_bucket_op();
    return bucket_for(key).get(key);
  }

  const V &at(const K &key) const override {
    count_bucket_op();
    return bucket_for(key).at(key);
  }

  std::optional<V> put(const K &key, const V &value) override {
    count_bucket_op();
    return bucket_for(key).put(key, value);
  }

  std::optional<V> remove(const K &key) override {
    count_bucket_op();
    return bucket_for(key).remove(key);
  }

  bool contains(const K &key) const override {
    count_bucket_op();
    return bucket_for(key).contains(key);
  }

  // Sums every bucket: O(bucket_count). Keep it off any per-insert path.
  size_t size() const override {
    size_t total = 0;
    for (const auto &bucket : buckets) {
      total += bucket.size();
    }
    counters.size_scans.fetch_add(buckets.size(), std::memory_order_relaxed);
    return total;
  }

  // Empties every bucket; the bucket count stays.
  void clear() override {
    for (auto &bucket : buckets) {
      bucket.clear();
    }
  }

  void for_each(
      const std::function<void(const K &, const V &)> &fn) const override {
    for (const auto &bucket : buckets) {
      bucket.for_each(fn);
    }
  }

  MapStats &stats() { return counters; }
  const MapStats &stats() const { return counters; }

  // for debugging purposes
  void display(std::ostream &os = std::cerr, size_t max_buckets = 16) const {
    os << "========================================" << std::endl;
    os << "Buckets: " << buckets.size() << std::endl;
    for (size_t i = 0; i < buckets.size() && i < max_buckets; i++) {
      os << "Bucket " << i << " (" << buckets[i].size() << "): ";
      for (const auto &entry : buckets[i]) {
        os << entry.first << " ";
      }
      os << std::endl;
    }
    if (buckets.size() > max_buckets) {
      os << "... " << buckets.size() - max_buckets << " more buckets"
         << std::endl;
    }
    os << "========================================" << std::endl;
  }
};
