#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "logger.hpp"
#include "row_range.hpp"

namespace pqlens {

// Default configuration constants
namespace defaults {
constexpr int64_t ROWS = 10;
constexpr double MEMORY_THRESHOLD_MB = 100.0;
constexpr size_t CACHE_CAPACITY = 10;
constexpr int MIN_COLUMN_WIDTH = 10;
constexpr int MAX_COLUMN_WIDTH = 100;
constexpr int ROW_INDEX_WIDTH = 6;
constexpr int SEPARATOR_WIDTH = 3;
constexpr int TABLE_BORDER_WIDTH = 4;
constexpr int EXTRA_SPACE = 10;
constexpr int WIDTH_SAMPLE_SIZE = 10;
constexpr const char* TABLE_FORMAT = "grid";
constexpr const char* FILE_PATH = ".samples/weather.parquet";
}  // namespace defaults

// Horizontal space reserved around the data columns of a rendered table.
struct LayoutOptions {
  int min_column_width = defaults::MIN_COLUMN_WIDTH;
  int max_column_width = defaults::MAX_COLUMN_WIDTH;
  int row_index_width = defaults::ROW_INDEX_WIDTH;
  int separator_width = defaults::SEPARATOR_WIDTH;
  int table_border_width = defaults::TABLE_BORDER_WIDTH;
  int extra_space = defaults::EXTRA_SPACE;
  int sample_size = defaults::WIDTH_SAMPLE_SIZE;
};

// Settings for one viewer session
class ViewerConfig {
 private:
  std::string file_path = defaults::FILE_PATH;

  // Rows shown by the one-shot display, page size in interactive mode
  int64_t rows = defaults::ROWS;

  bool interactive = false;

  std::string table_format = defaults::TABLE_FORMAT;

  // Empty means every column of the file
  std::vector<std::string> columns;

  std::optional<RowRange> row_range;

  // File size above which the reader switches to lazy loading
  double memory_threshold_mb = defaults::MEMORY_THRESHOLD_MB;

  bool lazy_loading_enabled = true;

  size_t cache_capacity = defaults::CACHE_CAPACITY;

  LayoutOptions layout;

  // Force the plain-text renderer
  bool plain_output = false;

  std::string log_file;

  LogLevel log_level = LogLevel::WARN;

  friend class ViewerConfigBuilder;

 public:
  const std::string& get_file_path() const { return file_path; }
  int64_t get_rows() const { return rows; }
  bool is_interactive() const { return interactive; }
  const std::string& get_table_format() const { return table_format; }
  const std::vector<std::string>& get_columns() const { return columns; }
  const std::optional<RowRange>& get_row_range() const { return row_range; }
  double get_memory_threshold_mb() const { return memory_threshold_mb; }
  bool is_lazy_loading_enabled() const { return lazy_loading_enabled; }
  size_t get_cache_capacity() const { return cache_capacity; }
  const LayoutOptions& get_layout() const { return layout; }
  bool is_plain_output() const { return plain_output; }
  const std::string& get_log_file() const { return log_file; }
  LogLevel get_log_level() const { return log_level; }
};

// Builder class for ViewerConfig
class ViewerConfigBuilder {
 private:
  ViewerConfig config;

 public:
  ViewerConfigBuilder() = default;

  explicit ViewerConfigBuilder(ViewerConfig base) : config(std::move(base)) {}

  ViewerConfigBuilder &with_file_path(const std::string &path) {
    config.file_path = path;
    return *this;
  }

  ViewerConfigBuilder &with_rows(int64_t rows) {
    config.rows = rows;
    return *this;
  }

  ViewerConfigBuilder &with_interactive(bool enabled) {
    config.interactive = enabled;
    return *this;
  }

  ViewerConfigBuilder &with_table_format(const std::string &format) {
    config.table_format = format;
    return *this;
  }

  ViewerConfigBuilder &with_columns(std::vector<std::string> columns) {
    config.columns = std::move(columns);
    return *this;
  }

  ViewerConfigBuilder &with_row_range(std::optional<RowRange> range) {
    config.row_range = range;
    return *this;
  }

  ViewerConfigBuilder &with_memory_threshold_mb(double threshold_mb) {
    config.memory_threshold_mb = threshold_mb;
    return *this;
  }

  ViewerConfigBuilder &with_lazy_loading(bool enabled) {
    config.lazy_loading_enabled = enabled;
    return *this;
  }

  ViewerConfigBuilder &with_cache_capacity(size_t capacity) {
    config.cache_capacity = capacity;
    return *this;
  }

  ViewerConfigBuilder &with_min_column_width(int width) {
    config.layout.min_column_width = width;
    return *this;
  }

  ViewerConfigBuilder &with_max_column_width(int width) {
    config.layout.max_column_width = width;
    return *this;
  }

  ViewerConfigBuilder &with_plain_output(bool plain) {
    config.plain_output = plain;
    return *this;
  }

  ViewerConfigBuilder &with_log_file(const std::string &path) {
    config.log_file = path;
    return *this;
  }

  ViewerConfigBuilder &with_log_level(LogLevel level) {
    config.log_level = level;
    return *this;
  }

  [[nodiscard]] ViewerConfig build() const { return config; }
};

// Helper function to create a config builder
inline ViewerConfigBuilder make_config() { return {}; }

}  // namespace pqlens

#endif  // CONFIG_HPP
