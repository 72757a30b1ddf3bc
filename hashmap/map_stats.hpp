#pragma once

#include <atomic>
#include <cstdint>

// Elementary bucket work done by a map. Counters are atomic so readers sharing
// a lock can record work; ordering doesn't matter.
struct MapStats {
  // get/put/remove calls routed to a single bucket
  std::atomic<uint64_t> bucket_ops{0};
  // bucket sizes read while summing the whole table
  std::atomic<uint64_t> size_scans{0};
  std::atomic<uint64_t> rehashes{0};
  // entries moved into a new bucket array
  std::atomic<uint64_t> migrated{0};

  MapStats() = default;
  MapStats(const MapStats &other) { *this = other; }

  MapStats &operator=(const MapStats &other) {
    bucket_ops.store(other.bucket_ops.load(std::memory_order_relaxed),
                     std::memory_order_relaxed);
    size_scans.store(other.size_scans.load(std::memory_order_relaxed),
                     std::memory_order_relaxed);
    rehashes.store(other.rehashes.load(std::memory_order_relaxed),
                   std::memory_order_relaxed);
    migrated.store(other.migrated.load(std::memory_order_relaxed),
                   std::memory_order_relaxed);
    return *this;
  }

  uint64_t total_work() const {
    return bucket_ops.load(std::memory_order_relaxed) +
           size_scans.load(std::memory_order_relaxed) +
           migrated.load(std::memory_order_relaxed);
  }

  void reset() {
    bucket_ops.store(0, std::memory_order_relaxed);
    size_scans.store(0, std::memory_order_relaxed);
    rehashes.store(0, std::memory_order_relaxed);
    migrated.store(0, std::memory_order_relaxed);
  }
};
