#include "chunk_fetcher.hpp"

#include <arrow/api.h>

#include "errors.hpp"
#include "logger.hpp"

namespace pqlens {

namespace {

std::shared_ptr<arrow::Schema> project(
    const std::shared_ptr<arrow::Schema>& schema,
    const ColumnSelection& columns) {
  if (!columns.has_value()) {
    return schema;
  }
  arrow::FieldVector fields;
  fields.reserve(columns->size());
  for (int index : *columns) {
    fields.push_back(schema->field(index));
  }
  return arrow::schema(fields, schema->metadata());
}

}  // namespace

ChunkFetcher::ChunkFetcher(std::shared_ptr<DatasetHandle> dataset,
                           const LoadStrategy strategy,
                           ColumnSelection columns,
                           const size_t cache_capacity)
    : dataset_(std::move(dataset)),
      strategy_(strategy),
      columns_(std::move(columns)),
      projected_schema_(project(dataset_->schema(), columns_)),
      cache_(cache_capacity) {}

arrow::Result<Chunk> ChunkFetcher::fetch(const RowRange& range) {
  ARROW_ASSIGN_OR_RAISE(auto clamped,
                        validate_range(range, dataset_->total_rows()));
  if (clamped.start >= dataset_->total_rows() || clamped.empty()) {
    return empty_chunk();
  }
  if (strategy_ == LoadStrategy::Eager) {
    return fetch_eager(clamped);
  }
  return fetch_lazy(clamped);
}

arrow::Result<Chunk> ChunkFetcher::fetch_eager(const RowRange& range) {
  if (!full_table_) {
    log_debug("Materializing {} rows of '{}'", dataset_->total_rows(),
              dataset_->path());
    ++decode_calls_;
    ARROW_ASSIGN_OR_RAISE(full_table_, dataset_->source().read_all(columns_));
  }
  return full_table_->Slice(range.start, range.length());
}

arrow::Result<Chunk> ChunkFetcher::fetch_lazy(const RowRange& range) {
  if (auto cached = cache_.get(range)) {
    return cached;
  }

  const ResolvedRange resolved =
      RowRangeResolver::resolve(dataset_->row_groups(), range);
  if (resolved.empty()) {
    return empty_chunk();
  }
  log_debug("Range {} -> {} row group(s) starting at {}, trim {}",
            range.to_string(), resolved.group_indices.size(),
            resolved.group_indices.front(), resolved.trim.to_string());

  ++decode_calls_;
  auto decoded =
      dataset_->source().read_row_groups(resolved.group_indices, columns_);
  if (!decoded.ok()) {
    log_error("Failed to read rows {} of '{}': {}", range.to_string(),
              dataset_->path(), decoded.status().ToString());
    return decoded.status();
  }

  auto sliced = (*decoded)->Slice(resolved.trim.start, resolved.trim.length());
  auto combined = sliced->CombineChunks();
  if (!combined.ok()) {
    return classify(combined.status());
  }
  Chunk chunk = combined.MoveValueUnsafe();
  cache_.put(range, chunk);
  return chunk;
}

arrow::Result<Chunk> ChunkFetcher::empty_chunk() const {
  return arrow::Table::MakeEmpty(projected_schema_);
}

}  // namespace pqlens
