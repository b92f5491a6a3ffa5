#ifndef DATASET_HPP
#define DATASET_HPP

#include <arrow/api.h>
#include <arrow/result.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "row_range.hpp"

namespace parquet::arrow {
class FileReader;
}

namespace pqlens {

// Top-level field indices to materialize; nullopt reads every column.
using ColumnSelection = std::optional<std::vector<int>>;

/**
 * Boundary with the columnar decoder. Implementations report the layout
 * of the file and decode whole row groups; slicing to exact rows is done by
 * the caller.
 */
class DataSource {
 public:
  virtual ~DataSource() = default;

  virtual std::shared_ptr<arrow::Schema> schema() const = 0;

  virtual std::vector<int64_t> row_group_sizes() const = 0;

  virtual arrow::Result<std::shared_ptr<arrow::Table>> read_row_groups(
      const std::vector<int>& row_groups, const ColumnSelection& columns) = 0;

  virtual arrow::Result<std::shared_ptr<arrow::Table>> read_all(
      const ColumnSelection& columns) = 0;
};

/**
 * Parquet decoding through parquet::arrow::FileReader. The reader is opened
 * once; only the footer is parsed until a read is requested.
 */
class ParquetDataSource : public DataSource {
 public:
  static arrow::Result<std::unique_ptr<ParquetDataSource>> Open(
      const std::string& path);

  ~ParquetDataSource() override;

  std::shared_ptr<arrow::Schema> schema() const override { return schema_; }

  std::vector<int64_t> row_group_sizes() const override;

  arrow::Result<std::shared_ptr<arrow::Table>> read_row_groups(
      const std::vector<int>& row_groups,
      const ColumnSelection& columns) override;

  arrow::Result<std::shared_ptr<arrow::Table>> read_all(
      const ColumnSelection& columns) override;

 private:
  ParquetDataSource(std::unique_ptr<parquet::arrow::FileReader> reader,
                    std::shared_ptr<arrow::Schema> schema);

  // Parquet leaf column indices backing the given top-level fields
  std::vector<int> leaf_columns(const std::vector<int>& fields) const;

  std::unique_ptr<parquet::arrow::FileReader> reader_;
  std::shared_ptr<arrow::Schema> schema_;
};

/**
 * An opened dataset: schema, row and column counts, row group layout and
 * the read handle. Immutable once inspected.
 */
class DatasetHandle {
 public:
  DatasetHandle(std::string path, int64_t file_size_bytes,
                std::unique_ptr<DataSource> source);

  const std::string& path() const { return path_; }
  int64_t file_size_bytes() const { return file_size_bytes_; }
  const std::shared_ptr<arrow::Schema>& schema() const { return schema_; }
  int64_t total_rows() const { return total_rows_; }
  int total_columns() const { return schema_->num_fields(); }
  int num_row_groups() const { return static_cast<int>(descriptors_.size()); }
  const std::vector<RowGroupDescriptor>& row_groups() const {
    return descriptors_;
  }

  DataSource& source() const { return *source_; }

  /**
   * @brief Field indices for @p names in the order given; an empty list
   * selects every column.
   *
   * @return UnsupportedSchema error naming the first unknown column
   */
  arrow::Result<ColumnSelection> select_columns(
      const std::vector<std::string>& names) const;

 private:
  std::string path_;
  int64_t file_size_bytes_;
  std::unique_ptr<DataSource> source_;
  std::shared_ptr<arrow::Schema> schema_;
  std::vector<RowGroupDescriptor> descriptors_;
  int64_t total_rows_;
};

class FileMetadataInspector {
 public:
  /**
   * @brief Opens @p path and reads its footer without decoding row data.
   *
   * Fails with NotFound, PermissionDenied, InvalidFormat (not Parquet or a
   * corrupt footer), UnsupportedSchema or Unknown. A missing .parquet/.pqt
   * extension only logs a warning.
   */
  static arrow::Result<std::shared_ptr<DatasetHandle>> inspect(
      const std::string& path);

  // Same checks, over an already constructed decoder.
  static arrow::Result<std::shared_ptr<DatasetHandle>> inspect(
      const std::string& path, int64_t file_size_bytes,
      std::unique_ptr<DataSource> source);
};

}  // namespace pqlens

#endif  // DATASET_HPP
