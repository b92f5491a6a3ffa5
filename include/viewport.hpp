#ifndef VIEWPORT_HPP
#define VIEWPORT_HPP

#include <arrow/status.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include "chunk_fetcher.hpp"
#include "config.hpp"
#include "line_input.hpp"
#include "memory_probe.hpp"
#include "renderer.hpp"
#include "terminal.hpp"

namespace pqlens {

// Scroll position: first visible row and first visible column.
struct ViewportState {
  int64_t top_row = 0;
  int left_column = 0;

  bool operator==(const ViewportState& other) const = default;
};

enum class Command {
  RowDown,
  RowUp,
  PageDown,
  PageUp,
  ColumnRight,
  ColumnLeft,
  Quit
};

std::string to_string(Command command);

/**
 * @brief Next scroll position after @p command.
 *
 * Total and clamped: rows stay in [0, total_rows) and columns in
 * [0, total_columns) (both 0 when there is nothing to show). Page down
 * stops so that the last page is full: from 0 with page 100 over 250 rows
 * it goes to 100, then 150. Quit leaves the state as is.
 */
ViewportState apply(const ViewportState& state, Command command,
                    int64_t total_rows, int total_columns, int64_t page_size);

// Live key bindings; nullopt for keys that do nothing.
std::optional<Command> command_for_key(const KeyEvent& key);

// Line mode bindings: n p f b r l q.
std::optional<Command> command_for_line(const std::string& line);

struct ViewOptions {
  int64_t page_size = defaults::ROWS;
  std::string table_format = defaults::TABLE_FORMAT;
  LayoutOptions layout;
};

/**
 * @brief Interactive pager over one dataset.
 *
 * Holds the scroll position and turns navigation commands into fetches and
 * rendered pages. A page that cannot be fetched prints a one-line error and
 * leaves the position where it was.
 */
class ViewportController {
 public:
  ViewportController(std::unique_ptr<ChunkFetcher> fetcher,
                     const TableRenderer& renderer, Terminal& terminal,
                     TerminalCapabilities caps, const MemoryProbe& memory,
                     ViewOptions options, std::ostream& out);

  const ViewportState& state() const { return state_; }
  int64_t total_rows() const;
  int total_columns() const;
  int64_t page_size() const { return options_.page_size; }
  int64_t total_pages() const;

  const ChunkFetcher& fetcher() const { return *fetcher_; }

  /**
   * @brief Draws the page at the current position.
   *
   * With no columns, prints the row count and an explanation instead and
   * does not touch the data.
   */
  arrow::Status render();

  /**
   * @brief Applies @p command and redraws.
   *
   * @param always_render redraw even if the position did not move
   * @return false once the command is Quit
   */
  bool dispatch(Command command, bool always_render = false);

  /**
   * @brief Runs the session until the user quits or input ends.
   *
   * Live key capture when the terminal supports it, otherwise typed
   * commands read from @p lines.
   */
  void run(LineReader& lines);

  void run_live_keys();
  void run_line_mode(LineReader& lines);

 private:
  arrow::Status render_state(const ViewportState& state);
  std::string navigation_line(int first_column, size_t visible_columns) const;
  void report_failure(const arrow::Status& status);

  // Prints why there is nothing to page through; false when there is data
  bool explain_empty();

  std::unique_ptr<ChunkFetcher> fetcher_;
  const TableRenderer& renderer_;
  Terminal& terminal_;
  TerminalCapabilities caps_;
  const MemoryProbe& memory_;
  ViewOptions options_;
  std::ostream& out_;
  ViewportState state_;
};

}  // namespace pqlens

#endif  // VIEWPORT_HPP
