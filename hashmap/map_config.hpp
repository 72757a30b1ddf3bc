#pragma once

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>

const size_t DEFAULT_BUCKET_COUNT = 2;
const float DEFAULT_LOAD_FACTOR = 1.0f;
// below this a single put could double the table dozens of times
const float MIN_LOAD_FACTOR = 0.01f;

// How TrackedHashMap's counter survives a rehash.
enum rehash_policy {
  // rehash only redistributes, so the count is left as is
  CARRY_COUNT,
  // reset the count and take it from the number of migrated entries
  RECOUNT_ON_REHASH
};

struct MapConfig {
  size_t bucket_count = DEFAULT_BUCKET_COUNT;
  // rehash once entries > bucket_count * load_factor
  float load_factor = DEFAULT_LOAD_FACTOR;
  rehash_policy policy = CARRY_COUNT;

  const MapConfig &validate() const {
    if (bucket_count == 0) {
      throw std::invalid_argument("bucket count must be at least 1");
    }
    if (!std::isfinite(load_factor) || load_factor < MIN_LOAD_FACTOR) {
      throw std::invalid_argument("load factor must be finite and at least " +
                                  std::to_string(MIN_LOAD_FACTOR));
    }
    return *this;
  }
};
