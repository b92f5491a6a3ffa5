#ifndef TEXT_TABLE_HPP
#define TEXT_TABLE_HPP

#include <arrow/api.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pqlens {

// Text shown for a null cell
constexpr const char* kNullCell = "null";
constexpr const char* kEllipsis = "...";

/**
 * A page of already formatted, already truncated cells, ready for a
 * renderer. Row i of the page is logical row first_row + i of the file.
 */
struct TextTable {
  std::vector<std::string> headers;
  // Numeric columns are right-aligned by the grid renderer
  std::vector<bool> right_align;
  std::vector<std::vector<std::string>> rows;
  int64_t first_row = 0;

  size_t num_columns() const { return headers.size(); }
  size_t num_rows() const { return rows.size(); }
};

// Number of terminal cells the UTF-8 text occupies (one per code point).
size_t display_width(std::string_view text);

/**
 * @brief Shortens @p text to at most @p max_width display cells, ending
 * with "..." when anything was cut.
 */
std::string truncate_cell(const std::string& text, int max_width);

/**
 * @brief String form of one cell; nulls become kNullCell.
 */
std::string format_cell(const arrow::Array& array, int64_t index);

// Every cell of a column, through format_cell, across chunk boundaries.
std::vector<std::string> format_column(const arrow::ChunkedArray& column,
                                       int64_t limit = -1);

/**
 * @brief Builds the page for @p columns of @p table.
 *
 * @param first_row logical index of the table's first row
 * @param max_width cap applied to headers and cells
 */
TextTable make_text_table(const arrow::Table& table,
                          const std::vector<int>& columns, int64_t first_row,
                          int max_width);

// 1234567 -> "1,234,567"
std::string group_digits(int64_t value);

}  // namespace pqlens

#endif  // TEXT_TABLE_HPP
