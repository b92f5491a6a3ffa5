#include "display.hpp"

#include <algorithm>
#include <numeric>
#include <vector>

#include "logger.hpp"
#include "text_table.hpp"

namespace pqlens {

namespace {

std::vector<int> all_columns(const arrow::Table& table) {
  std::vector<int> columns(table.num_columns());
  std::iota(columns.begin(), columns.end(), 0);
  return columns;
}

}  // namespace

void print_summary(const ChunkFetcher& fetcher, std::ostream& out) {
  const auto& dataset = fetcher.dataset();
  const auto& schema = fetcher.projected_schema();
  out << "\nParquet file shape: (" << group_digits(dataset.total_rows())
      << ", " << schema->num_fields() << ")\n";
  out << "Load strategy: " << to_string(fetcher.strategy()) << " ("
      << dataset.num_row_groups() << " row group"
      << (dataset.num_row_groups() == 1 ? "" : "s") << ")\n";
  if (schema->num_fields() == 0) {
    return;
  }

  size_t name_width = 0;
  for (const auto& field : schema->fields()) {
    name_width = std::max(name_width, display_width(field->name()));
  }
  out << "\nColumn types:\n";
  for (const auto& field : schema->fields()) {
    out << "  " << field->name()
        << std::string(name_width - display_width(field->name()), ' ')
        << "  " << field->type()->ToString() << "\n";
  }
}

arrow::Status display_once(ChunkFetcher& fetcher,
                           const TableRenderer& renderer,
                           const DisplayOptions& options, std::ostream& out) {
  const auto& dataset = fetcher.dataset();
  print_summary(fetcher, out);

  if (fetcher.projected_schema()->num_fields() == 0) {
    out << "\nThis Parquet file has no columns.\n"
        << "It contains only row metadata without any data columns.\n";
    if (dataset.total_rows() > 0) {
      out << "Number of rows: " << group_digits(dataset.total_rows()) << "\n";
    }
    return arrow::Status::OK();
  }

  RowRange range{0, std::max<int64_t>(options.rows, 0)};
  if (options.row_range) {
    range = *options.row_range;
  }
  ARROW_ASSIGN_OR_RAISE(auto chunk, fetcher.fetch(range));
  log_debug("Displaying {} row(s) from {}", chunk->num_rows(),
            range.to_string());

  if (dataset.total_rows() == 0) {
    out << "\nFile structure (no data rows):\n";
  } else if (options.row_range) {
    out << "\nRows " << range.start << " to "
        << range.start + chunk->num_rows() << " of "
        << group_digits(dataset.total_rows()) << ":\n";
  } else {
    out << "\nFirst " << chunk->num_rows() << " rows:\n";
  }

  const TextTable table =
      make_text_table(*chunk, all_columns(*chunk), range.start,
                      options.layout.max_column_width);
  out << renderer.render(table, options.table_format, true) << "\n";
  return arrow::Status::OK();
}

}  // namespace pqlens
