#pragma once

#include "associative_map.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>

// Unordered association list. Every lookup is a linear scan, so it is only
// meant to hold the handful of entries that land in one bucket.
template <typename K, typename V>
class LinearMap : public AssociativeMap<K, V> {
private:
  using Entry = std::pair<K, V>;
  std::vector<Entry> items;

  typename std::vector<Entry>::iterator find(const K &key) {
    return std::find_if(
        items.begin(), items.end(),
        [&key](const Entry &entry) { return entry.first == key; });
  }

  typename std::vector<Entry>::const_iterator find(const K &key) const {
    return std::find_if(
        items.begin(), items.end(),
        [&key](const Entry &entry) { return entry.first == key; });
  }

public:
  using const_iterator = typename std::vector<Entry>::const_iterator;

  std::optional<V> get(const K &key) const override {
    auto it = find(key);
    if (it == items.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  const V &at(const K &key) const override {
    auto it = find(key);
    if (it == items.end()) {
      throw std::out_of_range("Key not found in map");
    }
    return it->second;
  }

  std::optional<V> put(const K &key, const V &value) override {
    auto it = find(key);
    if (it != items.end()) {
      std::optional<V> previous(it->second);
      it->second = value;
      return previous;
    }
    items.emplace_back(key, value);
    return std::nullopt;
  }

  std::optional<V> remove(const K &key) override {
    auto it = find(key);
    if (it == items.end()) {
      return std::nullopt;
    }
    std::optional<V> removed(std::move(it->second));
    // order is unspecified, so fill the hole with the last entry
    if (it != items.end() - 1) {
      *it = std::move(items.back());
    }
    items.pop_back();
    return removed;
  }

  // Removes the most recently inserted entry if it holds key. Never copies
  // or moves a value, so it cannot throw for a non-throwing key compare.
  bool drop_last(const K &key) {
    if (items.empty() || !(items.back().first == key)) {
      return false;
    }
    items.pop_back();
    return true;
  }

  bool contains(const K &key) const override {
    return find(key) != items.end();
  }

  size_t size() const override { return items.size(); }

  void clear() override { items.clear(); }

  void for_each(
      const std::function<void(const K &, const V &)> &fn) const override {
    for (const auto &entry : items) {
      fn(entry.first, entry.second);
    }
  }

  const_iterator begin() const { return items.begin(); }
  const_iterator end() const { return items.end(); }
};
