#include "dataset.hpp"

#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/schema.h>
#include <parquet/file_reader.h>
#include <parquet/metadata.h>

#include <algorithm>
#include <new>
#include <numeric>

#include "errors.hpp"
#include "file_utils.hpp"
#include "logger.hpp"

namespace pqlens {

namespace {

void collect_leaves(const parquet::arrow::SchemaField& field,
                    std::vector<int>& out) {
  if (field.column_index >= 0) {
    out.push_back(field.column_index);
  }
  for (const auto& child : field.children) {
    collect_leaves(child, out);
  }
}

}  // namespace

ParquetDataSource::ParquetDataSource(
    std::unique_ptr<parquet::arrow::FileReader> reader,
    std::shared_ptr<arrow::Schema> schema)
    : reader_(std::move(reader)), schema_(std::move(schema)) {}

ParquetDataSource::~ParquetDataSource() = default;

arrow::Result<std::unique_ptr<ParquetDataSource>> ParquetDataSource::Open(
    const std::string& path) {
  auto input_file = arrow::io::ReadableFile::Open(path);
  if (!input_file.ok()) {
    return classify(input_file.status());
  }

  auto reader =
      parquet::arrow::OpenFile(*input_file, arrow::default_memory_pool());
  if (!reader.ok()) {
    // Anything the footer parser rejects is a format problem, whatever code
    // the decoder picked for it.
    const auto kind = error_kind(reader.status());
    return make_error(
        kind == ErrorKind::Unknown ? ErrorKind::InvalidFormat : kind,
        reader.status().message());
  }

  std::shared_ptr<arrow::Schema> schema;
  if (auto status = (*reader)->GetSchema(&schema); !status.ok()) {
    return make_error(ErrorKind::UnsupportedSchema, status.message());
  }

  return std::unique_ptr<ParquetDataSource>(
      new ParquetDataSource(std::move(*reader), std::move(schema)));
}

std::vector<int64_t> ParquetDataSource::row_group_sizes() const {
  const auto metadata = reader_->parquet_reader()->metadata();
  std::vector<int64_t> sizes;
  sizes.reserve(metadata->num_row_groups());
  for (int i = 0; i < metadata->num_row_groups(); ++i) {
    sizes.push_back(metadata->RowGroup(i)->num_rows());
  }
  return sizes;
}

std::vector<int> ParquetDataSource::leaf_columns(
    const std::vector<int>& fields) const {
  const auto& manifest = reader_->manifest();
  std::vector<int> leaves;
  for (int field : fields) {
    collect_leaves(manifest.schema_fields[field], leaves);
  }
  return leaves;
}

arrow::Result<std::shared_ptr<arrow::Table>>
ParquetDataSource::read_row_groups(const std::vector<int>& row_groups,
                                   const ColumnSelection& columns) {
  std::shared_ptr<arrow::Table> table;
  try {
    arrow::Status status =
        columns ? reader_->ReadRowGroups(row_groups, leaf_columns(*columns),
                                         &table)
                : reader_->ReadRowGroups(row_groups, &table);
    if (!status.ok()) {
      return classify(status);
    }
  } catch (const std::bad_alloc&) {
    return make_error(ErrorKind::OutOfMemory,
                      "Out of memory while decoding row groups");
  }
  return table;
}

arrow::Result<std::shared_ptr<arrow::Table>> ParquetDataSource::read_all(
    const ColumnSelection& columns) {
  std::shared_ptr<arrow::Table> table;
  try {
    arrow::Status status = columns
                               ? reader_->ReadTable(leaf_columns(*columns),
                                                    &table)
                               : reader_->ReadTable(&table);
    if (!status.ok()) {
      return classify(status);
    }
  } catch (const std::bad_alloc&) {
    return make_error(ErrorKind::OutOfMemory,
                      "Out of memory while reading the whole file");
  }
  return table;
}

DatasetHandle::DatasetHandle(std::string path, const int64_t file_size_bytes,
                             std::unique_ptr<DataSource> source)
    : path_(std::move(path)),
      file_size_bytes_(file_size_bytes),
      source_(std::move(source)),
      schema_(source_->schema()),
      descriptors_(make_descriptors(source_->row_group_sizes())),
      total_rows_(descriptors_.empty() ? 0 : descriptors_.back().end()) {}

arrow::Result<ColumnSelection> DatasetHandle::select_columns(
    const std::vector<std::string>& names) const {
  if (names.empty()) {
    return ColumnSelection{};
  }
  std::vector<int> indices;
  indices.reserve(names.size());
  for (const auto& name : names) {
    const int index = schema_->GetFieldIndex(name);
    if (index < 0) {
      return make_error(ErrorKind::UnsupportedSchema,
                        "Column '" + name + "' not in schema " +
                            schema_->ToString(false));
    }
    // A repeated name selects its column once, at its first position
    if (std::find(indices.begin(), indices.end(), index) == indices.end()) {
      indices.push_back(index);
    }
  }
  return ColumnSelection{std::move(indices)};
}

arrow::Result<std::shared_ptr<DatasetHandle>> FileMetadataInspector::inspect(
    const std::string& path) {
  ARROW_RETURN_NOT_OK(check_readable(path));
  ARROW_ASSIGN_OR_RAISE(const int64_t size, file_size(path));

  if (!has_parquet_extension(path)) {
    log_warn("File '{}' does not have a .parquet extension, reading it as "
             "Parquet anyway",
             path);
  }

  ARROW_ASSIGN_OR_RAISE(auto source, ParquetDataSource::Open(path));
  return inspect(path, size, std::move(source));
}

arrow::Result<std::shared_ptr<DatasetHandle>> FileMetadataInspector::inspect(
    const std::string& path, const int64_t file_size_bytes,
    std::unique_ptr<DataSource> source) {
  if (!source || !source->schema()) {
    return make_error(ErrorKind::Unknown, "No decoder for " + path);
  }
  auto handle = std::make_shared<DatasetHandle>(path, file_size_bytes,
                                                std::move(source));
  if (handle->total_columns() == 0) {
    log_warn("Parquet file '{}' has no columns", path);
  }
  log_info("Opened {}: {} rows, {} columns, {} row groups, {} bytes", path,
           handle->total_rows(), handle->total_columns(),
           handle->num_row_groups(), file_size_bytes);
  return handle;
}

}  // namespace pqlens
