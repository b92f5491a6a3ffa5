#ifndef CHUNK_CACHE_HPP
#define CHUNK_CACHE_HPP

#include <arrow/table.h>

#include <cstddef>
#include <list>
#include <memory>
#include <unordered_map>
#include <utility>

#include "config.hpp"
#include "row_range.hpp"

namespace pqlens {

// A materialized slice of the dataset covering exactly one RowRange.
using Chunk = std::shared_ptr<arrow::Table>;

struct CacheStats {
  size_t hits = 0;
  size_t misses = 0;
  size_t evictions = 0;
};

/**
 * Bounded cache of fetched slices keyed by their exact row range.
 *
 * Entries are evicted in insertion order (FIFO): a lookup does not refresh
 * an entry, so scrolling back to a recently viewed but early-inserted range
 * may miss. Lookups match the key exactly; a range contained in a cached
 * one is still a miss.
 */
class ChunkCache {
 public:
  explicit ChunkCache(size_t capacity = defaults::CACHE_CAPACITY);

  Chunk get(const RowRange& range);

  // Re-putting a cached key replaces the chunk in place and keeps the
  // entry's original position in the eviction order.
  void put(const RowRange& range, Chunk chunk);

  bool contains(const RowRange& range) const {
    return index_.contains(range);
  }

  void clear();

  size_t size() const { return index_.size(); }
  size_t capacity() const { return capacity_; }
  const CacheStats& stats() const { return stats_; }

 private:
  using Entry = std::pair<RowRange, Chunk>;

  size_t capacity_;
  // Oldest insertion at the front
  std::list<Entry> entries_;
  std::unordered_map<RowRange, std::list<Entry>::iterator, RowRangeHash>
      index_;
  CacheStats stats_;
};

}  // namespace pqlens

#endif  // CHUNK_CACHE_HPP
