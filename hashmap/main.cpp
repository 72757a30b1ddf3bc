#include "shared_hash_map.hpp"
#include "tracked_hash_map.hpp"
#include <algorithm>
#include <cassert>
#include <iostream>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

// Test basic operations: put, overwrite, get, and remove.
template <typename Map> void test_basic_operations(const char *name) {
  Map map;
  // Initially empty
  assert(map.empty());

  // Insert key-value pairs
  assert(!map.put(1, "one"));
  assert(!map.put(2, "two"));
  assert(!map.put(3, "three"));
  assert(map.size() == 3);

  // Check existence
  assert(map.contains(1));
  assert(map.contains(2));
  assert(map.contains(3));
  assert(!map.contains(4));

  // Test get
  assert(map.get(2) == "two");
  assert(map.at(3) == "three");

  // Update the value for key 2, getting the old one back
  assert(map.put(2, "deux") == "two");
  assert(map.get(2) == "deux");
  assert(map.size() == 3);

  // Remove a key
  assert(map.remove(2) == "deux");
  assert(!map.contains(2));
  assert(map.size() == 2);

  // Attempt to remove a non-existent key
  assert(!map.remove(2));
  assert(map.size() == 2);

  std::cout << name << ": basic operations passed" << std::endl;
}

// Test edge cases such as retrieval from an empty map or non-existent keys.
template <typename Map> void test_edge_cases(const char *name) {
  Map map;
  assert(!map.get(42));
  assert(!map.remove(42));

  map.put(42, 100);
  assert(map.get(42) == 100);

  // Remove the only element and verify map emptiness.
  assert(map.remove(42) == 100);
  assert(map.empty());

  // at() should throw if key does not exist.
  try {
    map.at(42);
    assert(false); // Should not reach here
  } catch (const std::out_of_range &) {
    // Expected behavior.
  }

  // A value that looks "empty" is still a present key.
  map.put(0, 0);
  assert(map.contains(0));
  assert(map.get(0) == 0);

  // Clearing twice is harmless.
  map.clear();
  map.clear();
  assert(map.empty());
  assert(!map.contains(0));

  std::cout << name << ": edge cases passed" << std::endl;
}

// Test with different data types (using strings as keys and values).
template <typename Map> void test_data_types(const char *name) {
  Map map;
  map.put("apple", "red");
  map.put("banana", "yellow");
  map.put("grape", "purple");
  map.put("", "blank");

  assert(map.contains("apple"));
  assert(map.get("banana") == "yellow");
  assert(map.get("") == "blank");

  // Update a value and verify the update.
  map.put("apple", "green");
  assert(map.get("apple") == "green");
  assert(map.size() == 4);

  std::cout << name << ": data types passed" << std::endl;
}

struct Person {
  std::string name;
  int age;
};

// Test object storage by using a custom structure as the value.
void test_objects(AssociativeMap<int, Person> &people) {
  people.put(1, {"Alice", 30});
  people.put(2, {"Bob", 25});
  people.put(3, {"Charlie", 35});

  // Check retrieval and update of object values.
  assert(people.at(1).name == "Alice");
  people.put(1, {"Alice", 31});
  assert(people.at(1).age == 31);
  assert(people.remove(2)->name == "Bob");
  assert(!people.contains(2));
  assert(people.size() == 2);
}

void test_objects_all_layers() {
  LinearMap<int, Person> linear;
  BucketedMap<int, Person> bucketed;
  GrowableHashMap<int, Person> growable;
  TrackedHashMap<int, Person> tracked;
  SharedHashMap<int, Person> shared;

  std::vector<AssociativeMap<int, Person> *> maps = {
      &linear, &bucketed, &growable, &tracked, &shared};
  for (auto *map : maps) {
    test_objects(*map);
  }
  std::cout << "objects passed" << std::endl;
}

// Every present entry is visited exactly once.
template <typename Map> void test_iteration(const char *name) {
  Map map;
  const int N = 200;
  for (int i = 0; i < N; i++) {
    map.put(i, i * 10);
  }
  for (int i = 0; i < N; i += 3) {
    map.remove(i);
  }

  std::vector<int> keys = map.keys();
  std::sort(keys.begin(), keys.end());
  assert(std::adjacent_find(keys.begin(), keys.end()) == keys.end());
  assert(keys.size() == map.size());
  for (int key : keys) {
    assert(key % 3 != 0);
  }

  std::vector<int> values = map.values();
  assert(values.size() == map.size());

  for (const auto &entry : map.entries()) {
    assert(entry.second == entry.first * 10);
  }

  size_t visited = 0;
  map.for_each([&visited](const int &, const int &) { visited++; });
  assert(visited == map.size());

  map.clear();
  assert(map.keys().empty());

  std::cout << name << ": iteration passed" << std::endl;
}

void test_linear_map_removal_order() {
  LinearMap<int, int> bucket;
  for (int i = 0; i < 5; i++) {
    bucket.put(i, i);
  }
  // removing from the middle moves the last entry into the hole
  assert(bucket.remove(1) == 1);
  assert(bucket.size() == 4);
  for (int i : {0, 2, 3, 4}) {
    assert(bucket.get(i) == i);
  }
  // removing the last entry
  assert(bucket.remove(4) == 4);
  assert(bucket.remove(0) == 0);
  assert(bucket.remove(3) == 3);
  assert(bucket.remove(2) == 2);
  assert(bucket.empty());
  std::cout << "linear map removal passed" << std::endl;
}

void test_choose_map_is_deterministic() {
  BucketedMap<int, int> map(7);
  for (int key = -50; key < 50; key++) {
    size_t index = map.choose_map(key);
    assert(index < map.bucket_count());
    assert(index == map.choose_map(key));
    map.put(key, key);
    assert(map.bucket(index).contains(key));
  }
  assert(map.size() == 100);
  std::cout << "choose_map passed" << std::endl;
}

// Every key hashes to the same bucket.
struct CollidingHash {
  size_t operator()(int) const { return 7; }
};

void test_colliding_keys() {
  TrackedHashMap<int, int, CollidingHash> map;
  const int N = 300;
  for (int i = 0; i < N; i++) {
    map.put(i, -i);
  }
  assert(map.size() == N);
  assert(map.recount() == N);
  for (int i = 0; i < N; i++) {
    assert(map.get(i) == -i);
  }
  for (int i = 0; i < N; i += 2) {
    assert(map.remove(i));
  }
  assert(map.size() == N / 2);
  assert(map.recount() == N / 2);
  std::cout << "colliding keys passed" << std::endl;
}

void test_pointer_keys() {
  int a = 1;
  int b = 2;
  TrackedHashMap<const int *, std::string> map;
  map.put(nullptr, "null");
  map.put(&a, "a");
  map.put(&b, "b");
  assert(map.get(nullptr) == "null");
  assert(map.get(&a) == "a");
  assert(map.remove(nullptr) == "null");
  assert(!map.contains(nullptr));
  assert(map.size() == 2);
  std::cout << "pointer keys passed" << std::endl;
}

void test_invalid_config() {
  auto expect_invalid = [](MapConfig config) {
    try {
      TrackedHashMap<int, int> map(config);
      assert(false);
    } catch (const std::invalid_argument &) {
    }
  };

  expect_invalid({0, 1.0f, CARRY_COUNT});
  expect_invalid({4, 0.0f, CARRY_COUNT});
  expect_invalid({4, -1.0f, RECOUNT_ON_REHASH});
  expect_invalid({4, std::numeric_limits<float>::quiet_NaN(), CARRY_COUNT});
  expect_invalid({4, std::numeric_limits<float>::infinity(), CARRY_COUNT});
  expect_invalid({4, 1e-30f, CARRY_COUNT});
  expect_invalid({4, MIN_LOAD_FACTOR / 2, RECOUNT_ON_REHASH});

  try {
    BucketedMap<int, int> map(0);
    assert(false);
  } catch (const std::invalid_argument &) {
  }

  // smallest valid table
  TrackedHashMap<int, int> map(MapConfig{1, 0.5f, CARRY_COUNT});
  map.put(1, 1);
  assert(map.bucket_count() == 2);
  assert(map.size() == 1);

  // lowest accepted threshold: one key needs 100 buckets, reached at once
  TrackedHashMap<int, int> sparse(
      MapConfig{1, MIN_LOAD_FACTOR, CARRY_COUNT});
  sparse.put(1, 1);
  assert(sparse.bucket_count() == 128);
  assert(sparse.stats().rehashes.load() == 1);
  std::cout << "invalid config passed" << std::endl;
}

// --- Concurrent Test Functions ---

const int NUM_INSERT_THREADS = 4;
const int NUM_CONTAINS_THREADS = 4;
const int NUM_OPS = 1000;

// Returns a random integer using thread-local generators.
int getRandomInt() {
  thread_local std::random_device rd;
  thread_local std::mt19937 gen(rd());
  thread_local std::uniform_int_distribution<int> dist(
      0, NUM_INSERT_THREADS * NUM_OPS * 2);
  return dist(gen);
}

// Function for threads that insert their own range of keys.
void insertValues(SharedHashMap<int, int> &map, int thread_id) {
  for (int i = 0; i < NUM_OPS; ++i) {
    int key = thread_id * NUM_OPS + i;
    map.put(key, key);
  }
  std::cout << "Insert thread " << thread_id << " finished" << std::endl;
}

// Function for threads that concurrently check for key existence.
void checkContains(SharedHashMap<int, int> &map, int thread_id) {
  for (int i = 0; i < NUM_OPS; ++i) {
    int key = getRandomInt();
    // Keys may or may not be present yet, but a present key has its own value.
    std::optional<int> value = map.get(key);
    assert(!value || *value == key);
  }
  std::cout << "Contains thread " << thread_id << " finished" << std::endl;
}

void test_concurrent_access() {
  SharedHashMap<int, int> concurrent_map;
  std::vector<std::thread> threads;

  // Spawn threads that insert values.
  for (int i = 0; i < NUM_INSERT_THREADS; ++i) {
    threads.emplace_back(insertValues, std::ref(concurrent_map), i);
  }
  // Spawn threads that look values up.
  for (int i = 0; i < NUM_CONTAINS_THREADS; ++i) {
    threads.emplace_back(checkContains, std::ref(concurrent_map), i);
  }

  // Wait for all threads to finish.
  for (auto &thread : threads) {
    thread.join();
  }

  size_t expected = NUM_INSERT_THREADS * NUM_OPS;
  assert(concurrent_map.size() == expected);
  assert(concurrent_map.recount() == expected);
  for (int key = 0; key < static_cast<int>(expected); key++) {
    assert(concurrent_map.at_copy(key) == key);
  }

  // Concurrent removal of every other key.
  threads.clear();
  for (int t = 0; t < NUM_INSERT_THREADS; ++t) {
    threads.emplace_back([&concurrent_map, t]() {
      for (int i = 0; i < NUM_OPS; i += 2) {
        assert(concurrent_map.remove(t * NUM_OPS + i));
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }
  assert(concurrent_map.size() == expected / 2);
  assert(concurrent_map.recount() == expected / 2);
  std::cout << "concurrent access passed" << std::endl;
}

// A value copied out with at_copy() is independent of the table, so it
// survives the rehashes a writer triggers while a reader holds it.
void test_at_copy_survives_writes() {
  SharedHashMap<int, std::string> map;
  map.put(0, "zero");

  std::thread writer([&map]() {
    for (int key = 1; key <= NUM_OPS; ++key) {
      map.put(key, std::to_string(key));
    }
  });
  std::thread reader([&map]() {
    for (int i = 0; i < NUM_OPS; ++i) {
      std::string value = map.at_copy(0);
      assert(value == "zero");
    }
  });
  writer.join();
  reader.join();

  std::string held = map.at_copy(0);
  for (int key = NUM_OPS + 1; key <= 4 * NUM_OPS; ++key) {
    map.put(key, std::to_string(key));
  }
  assert(held == "zero");
  assert(map.bucket_count() > 2);

  // with no writer running, at() is safe to read directly
  assert(map.at(0) == "zero");
  assert(map.at(NUM_OPS) == std::to_string(NUM_OPS));
  std::cout << "at_copy survives writes passed" << std::endl;
}

int main() {
  // Run basic, edge, data type, and object tests on every layer.
  test_basic_operations<LinearMap<int, std::string>>("LinearMap");
  test_basic_operations<BucketedMap<int, std::string>>("BucketedMap");
  test_basic_operations<GrowableHashMap<int, std::string>>("GrowableHashMap");
  test_basic_operations<TrackedHashMap<int, std::string>>("TrackedHashMap");
  test_basic_operations<SharedHashMap<int, std::string>>("SharedHashMap");

  test_edge_cases<LinearMap<int, int>>("LinearMap");
  test_edge_cases<BucketedMap<int, int>>("BucketedMap");
  test_edge_cases<GrowableHashMap<int, int>>("GrowableHashMap");
  test_edge_cases<TrackedHashMap<int, int>>("TrackedHashMap");
  test_edge_cases<SharedHashMap<int, int>>("SharedHashMap");

  test_data_types<BucketedMap<std::string, std::string>>("BucketedMap");
  test_data_types<GrowableHashMap<std::string, std::string>>(
      "GrowableHashMap");
  test_data_types<TrackedHashMap<std::string, std::string>>("TrackedHashMap");

  test_objects_all_layers();

  test_iteration<BucketedMap<int, int>>("BucketedMap");
  test_iteration<GrowableHashMap<int, int>>("GrowableHashMap");
  test_iteration<TrackedHashMap<int, int>>("TrackedHashMap");
  test_iteration<SharedHashMap<int, int>>("SharedHashMap");

  test_linear_map_removal_order();
  test_choose_map_is_deterministic();
  test_colliding_keys();
  test_pointer_keys();
  test_invalid_config();

  test_concurrent_access();
  test_at_copy_survives_writes();

  std::cout << "All tests passed!" << std::endl;
  return 0;
}
