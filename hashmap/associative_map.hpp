#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

// Operations shared by every map layer. Each layer owns the layer below it and
// overrides only what changes the element count; everything else delegates.
template <typename K, typename V> class AssociativeMap {
public:
  virtual ~AssociativeMap() = default;

  // nullopt if key is absent
  virtual std::optional<V> get(const K &key) const = 0;

  // Throws std::out_of_range if key is absent. The reference stays valid
  // until the next put, remove or clear on this map; a put may rehash and move
  // every entry.
  virtual const V &at(const K &key) const = 0;

  // Returns the value previously mapped to key, nullopt if key was new.
  virtual std::optional<V> put(const K &key, const V &value) = 0;

  // Returns the removed value, nullopt if key was absent.
  virtual std::optional<V> remove(const K &key) = 0;

  virtual bool contains(const K &key) const = 0;
  virtual size_t size() const = 0;
  virtual void clear() = 0;

  // Visits every present entry exactly once, in no particular order.
  virtual void
  for_each(const std::function<void(const K &, const V &)> &fn) const = 0;

  bool empty() const { return size() == 0; }

  std::vector<K> keys() const {
    std::vector<K> result;
    for_each([&result](const K &key, const V &) { result.push_back(key); });
    return result;
  }

  std::vector<V> values() const {
    std::vector<V> result;
    for_each(
        [&result](const K &, const V &value) { result.push_back(value); });
    return result;
  }

  std::vector<std::pair<K, V>> entries() const {
    std::vector<std::pair<K, V>> result;
    for_each([&result](const K &key, const V &value) {
      result.emplace_back(key, value);
    });
    return result;
  }
};
