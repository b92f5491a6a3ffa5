#ifndef DISPLAY_HPP
#define DISPLAY_HPP

#include <arrow/status.h>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

#include "chunk_fetcher.hpp"
#include "config.hpp"
#include "renderer.hpp"

namespace pqlens {

struct DisplayOptions {
  int64_t rows = defaults::ROWS;
  // Takes precedence over rows when set
  std::optional<RowRange> row_range;
  std::string table_format = defaults::TABLE_FORMAT;
  LayoutOptions layout;
};

// Shape, load strategy and one "name: type" line per selected column.
void print_summary(const ChunkFetcher& fetcher, std::ostream& out);

/**
 * @brief Non-interactive output: summary followed by the first rows or the
 * requested row range.
 *
 * A file without columns prints its row count and an explanation; a file
 * without rows prints the header-only table.
 */
arrow::Status display_once(ChunkFetcher& fetcher,
                           const TableRenderer& renderer,
                           const DisplayOptions& options, std::ostream& out);

}  // namespace pqlens

#endif  // DISPLAY_HPP
