#include "column_layout.hpp"

#include <algorithm>

#include "text_table.hpp"

namespace pqlens {

int estimate_column_width(const ColumnSample& sample,
                          const LayoutOptions& layout) {
  size_t widest = display_width(sample.header);
  for (const auto& value : sample.values) {
    widest = std::max(widest, display_width(value));
  }
  const int content =
      std::min(std::max(static_cast<int>(widest), layout.min_column_width),
               layout.max_column_width);
  return content + layout.separator_width;
}

int data_width_budget(const int terminal_width, const LayoutOptions& layout) {
  return terminal_width - layout.row_index_width - layout.separator_width -
         layout.table_border_width - layout.extra_space;
}

std::vector<int> select_visible_columns(
    const std::vector<ColumnSample>& samples, const int left_column,
    const int terminal_width, const LayoutOptions& layout) {
  std::vector<int> visible;
  int available = data_width_budget(terminal_width, layout);

  for (int col = std::max(left_column, 0);
       col < static_cast<int>(samples.size()) &&
       available > layout.min_column_width;
       ++col) {
    const int width = estimate_column_width(samples[col], layout);
    if (width > available) {
      break;
    }
    visible.push_back(col);
    available -= width;
  }
  return visible;
}

std::vector<ColumnSample> sample_columns(const arrow::Table& table,
                                         const LayoutOptions& layout) {
  std::vector<ColumnSample> samples;
  samples.reserve(table.num_columns());
  for (int col = 0; col < table.num_columns(); ++col) {
    samples.push_back(
        ColumnSample{table.schema()->field(col)->name(),
                     format_column(*table.column(col), layout.sample_size)});
  }
  return samples;
}

}  // namespace pqlens
