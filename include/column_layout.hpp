#ifndef COLUMN_LAYOUT_HPP
#define COLUMN_LAYOUT_HPP

#include <arrow/table.h>

#include <string>
#include <vector>

#include "config.hpp"

namespace pqlens {

/**
 * Header plus a few leading values of one column, enough to guess how wide
 * it will render.
 */
struct ColumnSample {
  std::string header;
  std::vector<std::string> values;
};

// Estimated rendered width of a column, separator included.
int estimate_column_width(const ColumnSample& sample,
                          const LayoutOptions& layout);

// Width left for data columns once the row-index gutter and borders are
// accounted for.
int data_width_budget(int terminal_width, const LayoutOptions& layout);

/**
 * @brief Columns that fit the terminal, starting at @p left_column.
 *
 * First-fit: columns are taken left to right while the budget lasts and the
 * scan stops at the first one that does not fit, even if a narrower column
 * further right would.
 *
 * @return ascending column indices into @p samples; empty when not even
 * the first column fits
 */
std::vector<int> select_visible_columns(const std::vector<ColumnSample>& samples,
                                        int left_column, int terminal_width,
                                        const LayoutOptions& layout);

// Samples for every column of @p table (first layout.sample_size values).
std::vector<ColumnSample> sample_columns(const arrow::Table& table,
                                         const LayoutOptions& layout);

}  // namespace pqlens

#endif  // COLUMN_LAYOUT_HPP
