#include "tracked_hash_map.hpp"
#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

// Bucket count 2, threshold 1.0: rehash to 4 after the third key, to 8 after
// the fifth.
template <typename Map> void test_growth_scenario(const char *name) {
  Map map(MapConfig{2, 1.0f, CARRY_COUNT});
  const std::vector<std::string> values = {"a", "b", "c", "d", "e"};

  map.put(1, values[0]);
  map.put(2, values[1]);
  assert(map.bucket_count() == 2);
  assert(map.size() == 2);

  map.put(3, values[2]);
  assert(map.bucket_count() == 4);
  assert(map.size() == 3);

  map.put(4, values[3]);
  assert(map.bucket_count() == 4);
  assert(map.size() == 4);

  map.put(5, values[4]);
  assert(map.bucket_count() == 8);
  assert(map.size() == 5);
  assert(map.get(3) == "c");

  for (int key = 1; key <= 5; key++) {
    assert(map.get(key) == values[key - 1]);
  }
  assert(map.stats().rehashes.load() == 2);

  std::cout << name << ": growth scenario passed" << std::endl;
}

void test_overwrite_neutrality(rehash_policy policy) {
  TrackedHashMap<int, int> map(MapConfig{2, 1.0f, policy});
  for (int i = 0; i < 100; i++) {
    size_t before = map.size();
    assert(!map.put(i, i));
    assert(map.size() == before + 1);
  }
  for (int i = 0; i < 100; i++) {
    size_t before = map.size();
    assert(map.put(i, i + 1) == i);
    assert(map.size() == before);
    assert(map.get(i) == i + 1);
  }
  assert(map.recount() == 100);
  std::cout << "overwrite neutrality passed" << std::endl;
}

void test_removal_neutrality(rehash_policy policy) {
  TrackedHashMap<int, int> map(MapConfig{2, 1.0f, policy});
  for (int i = 0; i < 100; i++) {
    map.put(i, i);
  }
  // absent keys, including ones that share a bucket with present keys
  for (int i = 100; i < 200; i++) {
    assert(!map.remove(i));
    assert(map.size() == 100);
  }
  for (int i = 0; i < 100; i++) {
    size_t before = map.size();
    assert(map.remove(i) == i);
    assert(map.size() == before - 1);
    // second removal of the same key
    assert(!map.remove(i));
    assert(map.size() == before - 1);
  }
  assert(map.empty());
  assert(map.recount() == 0);
  std::cout << "removal neutrality passed" << std::endl;
}

void test_clear_empties() {
  TrackedHashMap<int, std::string> map;
  for (int i = 0; i < 50; i++) {
    map.put(i, std::to_string(i));
  }
  size_t buckets = map.bucket_count();
  map.clear();
  assert(map.size() == 0);
  assert(map.recount() == 0);
  assert(map.bucket_count() == buckets);
  for (int i = 0; i < 50; i++) {
    assert(!map.get(i));
    assert(!map.contains(i));
  }

  // usable again after clear
  map.put(7, "seven");
  assert(map.size() == 1);
  assert(map.get(7) == "seven");
  std::cout << "clear empties passed" << std::endl;
}

void test_rehash_preserves_content() {
  GrowableHashMap<int, int> growable(MapConfig{4, 1.0f, CARRY_COUNT});
  for (int i = 0; i < 4; i++) {
    growable.put(i * 1000, i);
  }
  size_t before = growable.size();
  size_t buckets = growable.bucket_count();
  assert(growable.rehash() == before);
  assert(growable.bucket_count() == buckets * 2);
  assert(growable.size() == before);
  for (int i = 0; i < 4; i++) {
    assert(growable.get(i * 1000) == i);
  }

  // every entry sits in the bucket the new count picks for it
  const auto &table = growable.table();
  for (size_t index = 0; index < table.bucket_count(); index++) {
    for (const auto &entry : table.bucket(index)) {
      assert(table.choose_map(entry.first) == index);
    }
  }

  TrackedHashMap<int, int> tracked;
  const int N = 5000;
  for (int i = 0; i < N; i++) {
    tracked.put(i, i * 3);
    // load factor holds after every put
    assert(tracked.size() <= tracked.bucket_count() * tracked.load_factor());
  }
  assert(tracked.size() == N);
  assert(tracked.recount() == N);
  for (int i = 0; i < N; i++) {
    assert(tracked.get(i) == i * 3);
  }
  std::cout << "rehash preserves content passed" << std::endl;
}

// Low thresholds need more than one doubling to get back under the load
// factor; put reaches that size with a single rehash.
void test_small_load_factor() {
  TrackedHashMap<int, int> map(MapConfig{1, 0.25f, CARRY_COUNT});
  map.put(0, 0);
  assert(map.bucket_count() == 4);
  assert(map.stats().rehashes.load() == 1);
  for (int i = 1; i < 64; i++) {
    map.put(i, i);
    assert(map.size() <= map.bucket_count() * 0.25);
  }
  assert(map.size() == 64);
  assert(map.bucket_count() == 256);
  assert(map.stats().rehashes.load() == 7);
  std::cout << "small load factor passed" << std::endl;
}

void test_growth_target() {
  GrowableHashMap<int, int> map(MapConfig{2, 1.0f, CARRY_COUNT});
  assert(map.growth_target(0) == 2);
  assert(map.growth_target(2) == 2);
  assert(map.growth_target(3) == 4);
  assert(map.growth_target(1000) == 1024);
  try {
    map.growth_target(std::numeric_limits<size_t>::max());
    assert(false);
  } catch (const std::length_error &) {
  }
  assert(map.bucket_count() == 2);
  std::cout << "growth target passed" << std::endl;
}

// Value whose copies start failing once copy_budget runs out. -1 never
// fails. Moves always succeed, so vector reallocation spends nothing.
struct FragileValue {
  static inline int copy_budget = -1;
  int id;

  explicit FragileValue(int id) : id(id) {}
  FragileValue(const FragileValue &other) : id(other.id) { spend(); }
  FragileValue(FragileValue &&other) noexcept : id(other.id) {}
  FragileValue &operator=(const FragileValue &other) {
    spend();
    id = other.id;
    return *this;
  }
  FragileValue &operator=(FragileValue &&other) noexcept {
    id = other.id;
    return *this;
  }

  static void spend() {
    if (copy_budget == 0) {
      throw std::runtime_error("copy failed");
    }
    if (copy_budget > 0) {
      copy_budget--;
    }
  }
};

template <typename K, typename V, typename Hash>
size_t recount_of(const TrackedHashMap<K, V, Hash> &map) {
  return map.recount();
}

template <typename K, typename V, typename Hash>
size_t recount_of(const GrowableHashMap<K, V, Hash> &map) {
  return map.table().size();
}

// Runs put(key, value) with the given copy budget and expects it to throw.
template <typename Map>
void put_expecting_failure(Map &map, int key, int value, int budget) {
  FragileValue::copy_budget = budget;
  bool threw = false;
  try {
    map.put(key, FragileValue(value));
  } catch (const std::runtime_error &) {
    threw = true;
  }
  FragileValue::copy_budget = -1;
  assert(threw);
}

// Map holding 1 -> 1 and 2 -> 2 in two buckets, exactly at its threshold.
template <typename Map> void check_untouched(const Map &map) {
  if (map.size() != 2 || recount_of(map) != 2) {
    map.display();
  }
  assert(map.size() == 2);
  assert(recount_of(map) == 2);
  assert(map.bucket_count() == 2);
  assert(map.size() <= map.bucket_count() * map.load_factor());
  assert(!map.contains(3));
  assert(map.get(1)->id == 1);
  assert(map.get(2)->id == 2);
}

// A put whose value copy throws, either while inserting into the bucket or
// while migrating entries during the rehash it triggers, leaves the map as it
// was.
template <typename Map> void test_throwing_put(const char *name, Map map) {
  map.put(1, FragileValue(1));
  map.put(2, FragileValue(2));
  check_untouched(map);

  // first copy fails: the bucket insert itself
  put_expecting_failure(map, 3, 3, 0);
  check_untouched(map);

  // insert succeeds, the first entry copied into the new buckets fails
  put_expecting_failure(map, 3, 3, 1);
  check_untouched(map);
  assert(map.stats().rehashes.load() == 0);

  // a later migration copy fails
  put_expecting_failure(map, 3, 3, 2);
  check_untouched(map);
  assert(map.stats().rehashes.load() == 0);

  // overwrite: the saved previous value, then the assignment
  put_expecting_failure(map, 1, 10, 0);
  check_untouched(map);
  put_expecting_failure(map, 1, 10, 1);
  check_untouched(map);

  // the map is still usable and grows as usual
  auto previous = map.put(3, FragileValue(3));
  assert(!previous);
  assert(map.size() == 3);
  assert(recount_of(map) == 3);
  assert(map.bucket_count() == 4);
  assert(map.get(3)->id == 3);
  std::cout << name << " throwing put passed" << std::endl;
}

// Random put/remove/clear, checked against std::unordered_map and the O(n)
// recount after every operation.
void test_random_operations(rehash_policy policy, uint32_t seed) {
  TrackedHashMap<int, int> map(MapConfig{2, 1.0f, policy});
  std::unordered_map<int, int> reference;
  std::mt19937 gen(seed);
  std::uniform_int_distribution<int> key_dist(0, 499);
  std::uniform_int_distribution<int> op_dist(0, 999);

  const int NUM_OPS = 20000;
  for (int i = 0; i < NUM_OPS; i++) {
    int key = key_dist(gen);
    int op = op_dist(gen);
    if (op < 600) {
      std::optional<int> previous = map.put(key, i);
      auto it = reference.find(key);
      assert(previous.has_value() == (it != reference.end()));
      assert(!previous || *previous == it->second);
      reference[key] = i;
    } else if (op < 998) {
      std::optional<int> removed = map.remove(key);
      bool erased = reference.erase(key) == 1;
      assert(removed.has_value() == erased);
    } else {
      map.clear();
      reference.clear();
    }

    if (map.size() != reference.size() || map.recount() != map.size()) {
      map.display();
    }
    assert(map.size() == reference.size());
    assert(map.recount() == map.size());
  }

  for (const auto &entry : reference) {
    assert(map.get(entry.first) == entry.second);
  }
  std::cout << "random operations passed (seed " << seed << ")" << std::endl;
}

// The two ways of carrying the counter through a rehash must agree.
void test_policies_agree() {
  TrackedHashMap<int, int> carry(MapConfig{2, 0.75f, CARRY_COUNT});
  TrackedHashMap<int, int> recount(MapConfig{2, 0.75f, RECOUNT_ON_REHASH});
  assert(carry.count_policy() == CARRY_COUNT);
  assert(recount.count_policy() == RECOUNT_ON_REHASH);

  std::mt19937 gen(7);
  std::uniform_int_distribution<int> key_dist(0, 2999);
  for (int i = 0; i < 10000; i++) {
    int key = key_dist(gen);
    std::optional<int> from_carry;
    std::optional<int> from_recount;
    if (i % 4 == 3) {
      from_carry = carry.remove(key);
      from_recount = recount.remove(key);
    } else {
      from_carry = carry.put(key, i);
      from_recount = recount.put(key, i);
    }
    assert(from_carry == from_recount);
    assert(carry.size() == recount.size());
    assert(carry.bucket_count() == recount.bucket_count());
  }
  assert(carry.stats().rehashes.load() == recount.stats().rehashes.load());
  assert(carry.recount() == carry.size());
  assert(recount.recount() == recount.size());
  for (int key = 0; key < 3000; key++) {
    assert(carry.get(key) == recount.get(key));
  }
  std::cout << "count policies agree passed" << std::endl;
}

template <typename Map> uint64_t work_for_inserts(int n) {
  Map map(MapConfig{2, 1.0f, CARRY_COUNT});
  for (int i = 0; i < n; i++) {
    map.put(i, i);
  }
  assert(map.size() == static_cast<size_t>(n));
  return map.stats().total_work();
}

// Counts elementary bucket work instead of timing. Quadrupling n should
// roughly quadruple the tracked map's work but grow the summing map's work by
// about 16x.
void test_amortized_cost() {
  const int N = 1000;

  uint64_t tracked_small = work_for_inserts<TrackedHashMap<int, int>>(N);
  uint64_t tracked_large = work_for_inserts<TrackedHashMap<int, int>>(4 * N);
  uint64_t growable_small = work_for_inserts<GrowableHashMap<int, int>>(N);
  uint64_t growable_large =
      work_for_inserts<GrowableHashMap<int, int>>(4 * N);

  std::cout << "tracked work:  n=" << N << " " << tracked_small
            << ", n=" << 4 * N << " " << tracked_large << std::endl;
  std::cout << "growable work: n=" << N << " " << growable_small
            << ", n=" << 4 * N << " " << growable_large << std::endl;

  // linear: a few units of work per insert
  assert(tracked_small <= 4 * static_cast<uint64_t>(N));
  assert(tracked_large <= 4 * static_cast<uint64_t>(4 * N));
  assert(tracked_large < 5 * tracked_small);

  // superlinear: summing every bucket on each insert
  assert(growable_large > 10 * growable_small);
  assert(growable_large > 100 * tracked_large);

  // the tracked map never sums its buckets while inserting
  TrackedHashMap<int, int> map;
  for (int i = 0; i < N; i++) {
    map.put(i, i);
    map.remove(i / 2);
    map.put(i / 2, i);
  }
  assert(map.stats().size_scans.load() == 0);
  map.reset_stats();
  assert(map.stats().total_work() == 0);
  std::cout << "amortized cost passed" << std::endl;
}

int main() {
  test_growth_scenario<GrowableHashMap<int, std::string>>("GrowableHashMap");
  test_growth_scenario<TrackedHashMap<int, std::string>>("TrackedHashMap");

  for (rehash_policy policy : {CARRY_COUNT, RECOUNT_ON_REHASH}) {
    test_overwrite_neutrality(policy);
    test_removal_neutrality(policy);
    test_random_operations(policy, 12345);
    test_random_operations(policy, 2024);
  }

  test_clear_empties();
  test_rehash_preserves_content();
  test_small_load_factor();
  test_growth_target();
  test_throwing_put("GrowableHashMap", GrowableHashMap<int, FragileValue>(
                                           MapConfig{2, 1.0f, CARRY_COUNT}));
  for (rehash_policy policy : {CARRY_COUNT, RECOUNT_ON_REHASH}) {
    test_throwing_put("TrackedHashMap", TrackedHashMap<int, FragileValue>(
                                            MapConfig{2, 1.0f, policy}));
  }
  test_policies_agree();
  test_amortized_cost();

  std::cout << "All tests passed!" << std::endl;
  return 0;
}
