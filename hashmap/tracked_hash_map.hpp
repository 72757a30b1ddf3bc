#pragma once

#include "growable_hash_map.hpp"
#include <iostream>
#include <ostream>

// GrowableHashMap with an element counter kept next to the buckets, so size()
// and the growth check in put() are O(1) and inserts stay amortized O(1).
//
// Invariant: between public calls, num_elements equals the sum of all bucket
// sizes. put() and remove() never consult the summed size; they adjust the
// counter by the size change of the one bucket they touch.
template <typename K, typename V, typename Hash = std::hash<K>>
class TrackedHashMap : public AssociativeMap<K, V> {
private:
  GrowableHashMap<K, V, Hash> map;
  size_t num_elements = 0;
  rehash_policy policy;

  // Runs op, which may change only the bucket owning key, and folds that
  // bucket's size change into num_elements. If op throws, the bucket is
  // measured again so the counter still matches.
  template <typename Op>
  std::optional<V> with_bucket_delta(const K &key, Op op) {
    const LinearMap<K, V> &bucket = map.table().bucket_for(key);
    num_elements -= bucket.size();
    std::optional<V> result;
    try {
      result = op();
    } catch (...) {
      num_elements += bucket.size();
      throw;
    }
    num_elements += bucket.size();
    return result;
  }

  // One rehash straight to the target size, so a failure leaves the old
  // table in place.
  void grow() {
    size_t moved = map.rehash(map.growth_target(num_elements));
    if (policy == RECOUNT_ON_REHASH) {
      num_elements = moved;
    }
  }

public:
  explicit TrackedHashMap(const MapConfig &config = MapConfig(),
                          Hash hasher = Hash())
      : map(config, hasher), policy(config.policy) {}

  std::optional<V> get(const K &key) const override { return map.get(key); }

  const V &at(const K &key) const override { return map.at(key); }

  // +1 for a new key, +0 for an overwrite, without asking which it was.
  std::optional<V> put(const K &key, const V &value) override {
    std::optional<V> previous = with_bucket_delta(
        key, [&]() { return map.table().put(key, value); });
    if (map.over_threshold(num_elements)) {
      try {
        grow();
      } catch (...) {
        // only a new key can cross the threshold; undo its insertion
        with_bucket_delta(key, [&]() {
          map.table().bucket_for(key).drop_last(key);
          return std::optional<V>();
        });
        throw;
      }
    }
    return previous;
  }

  // -1 if key was present, +0 otherwise.
  std::optional<V> remove(const K &key) override {
    return with_bucket_delta(key, [&]() { return map.table().remove(key); });
  }

  bool contains(const K &key) const override { return map.contains(key); }

  size_t size() const override { return num_elements; }

  void clear() override {
    map.clear();
    num_elements = 0;
  }

  void for_each(
      const std::function<void(const K &, const V &)> &fn) const override {
    map.for_each(fn);
  }

  // O(bucket_count) recount, for checking the counter.
  size_t recount() const { return map.table().size(); }

  size_t bucket_count() const { return map.bucket_count(); }
  float load_factor() const { return map.load_factor(); }
  rehash_policy count_policy() const { return policy; }

  const MapStats &stats() const { return map.stats(); }
  void reset_stats() { map.reset_stats(); }

  // for debugging purposes
  void display(std::ostream &os = std::cerr, size_t max_buckets = 16) const {
    os << "Tracked size: " << num_elements << std::endl;
    map.display(os, max_buckets);
  }
};
