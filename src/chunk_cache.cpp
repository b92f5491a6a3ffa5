#include "chunk_cache.hpp"

#include <stdexcept>

#include "logger.hpp"

namespace pqlens {

namespace {
const ContextLogger kLog("cache");
}

ChunkCache::ChunkCache(const size_t capacity) : capacity_(capacity) {
  if (capacity == 0) {
    throw std::invalid_argument("Chunk cache capacity must be greater than 0");
  }
}

Chunk ChunkCache::get(const RowRange& range) {
  const auto it = index_.find(range);
  if (it == index_.end()) {
    ++stats_.misses;
    kLog.debug("miss {}", range.to_string());
    return nullptr;
  }
  ++stats_.hits;
  kLog.debug("hit {}", range.to_string());
  return it->second->second;
}

void ChunkCache::put(const RowRange& range, Chunk chunk) {
  if (const auto it = index_.find(range); it != index_.end()) {
    it->second->second = std::move(chunk);
    return;
  }

  entries_.emplace_back(range, std::move(chunk));
  index_.emplace(range, std::prev(entries_.end()));

  if (index_.size() > capacity_) {
    const RowRange oldest = entries_.front().first;
    index_.erase(oldest);
    entries_.pop_front();
    ++stats_.evictions;
    kLog.debug("evicted {} (size {})", oldest.to_string(), index_.size());
  }
}

void ChunkCache::clear() {
  index_.clear();
  entries_.clear();
}

}  // namespace pqlens
