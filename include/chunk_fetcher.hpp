#ifndef CHUNK_FETCHER_HPP
#define CHUNK_FETCHER_HPP

#include <arrow/result.h>

#include <cstddef>
#include <memory>

#include "chunk_cache.hpp"
#include "dataset.hpp"
#include "load_strategy.hpp"
#include "row_range.hpp"

namespace pqlens {

/**
 * @brief Serves row ranges of a dataset as materialized chunks.
 *
 * Eager: the selected columns are decoded once, on the first fetch, and every
 * range is a zero-copy slice of that table.
 *
 * Lazy: a range is looked up in the ChunkCache by exact key; on a miss the
 * row groups covering it are decoded, trimmed to the requested rows and
 * cached.
 *
 * Owns the dataset's read handle for the session. Not thread-safe.
 */
class ChunkFetcher {
 public:
  ChunkFetcher(std::shared_ptr<DatasetHandle> dataset, LoadStrategy strategy,
               ColumnSelection columns = std::nullopt,
               size_t cache_capacity = defaults::CACHE_CAPACITY);

  /**
   * @brief Rows [range.start, range.end) of the selected columns.
   *
   * The end is clamped to the row count; a range starting at or past the
   * last row yields an empty chunk with the projected schema.
   *
   * @return InvalidArgument for a negative start or start > end, otherwise
   * the decoder's classified error
   */
  arrow::Result<Chunk> fetch(const RowRange& range);

  const DatasetHandle& dataset() const { return *dataset_; }
  LoadStrategy strategy() const { return strategy_; }
  const ColumnSelection& columns() const { return columns_; }
  const std::shared_ptr<arrow::Schema>& projected_schema() const {
    return projected_schema_;
  }

  const ChunkCache& cache() const { return cache_; }

  // Number of times the decoder was asked for data.
  size_t decode_calls() const { return decode_calls_; }

 private:
  arrow::Result<Chunk> fetch_eager(const RowRange& range);
  arrow::Result<Chunk> fetch_lazy(const RowRange& range);
  arrow::Result<Chunk> empty_chunk() const;

  std::shared_ptr<DatasetHandle> dataset_;
  LoadStrategy strategy_;
  ColumnSelection columns_;
  std::shared_ptr<arrow::Schema> projected_schema_;
  ChunkCache cache_;
  // Eager mode only
  std::shared_ptr<arrow::Table> full_table_;
  size_t decode_calls_ = 0;
};

}  // namespace pqlens

#endif  // CHUNK_FETCHER_HPP
