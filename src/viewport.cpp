#include "viewport.hpp"

#include <spdlog/common.h>

#include <algorithm>
#include <cctype>

#include "column_layout.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "text_table.hpp"

namespace pqlens {

namespace {

constexpr const char* kLineModeHelp =
    "Navigation: [n]ext row, [p]revious row, [f]orward page, [b]ack page, "
    "[r]ight column, [l]eft column, [q]uit";
constexpr const char* kLineModePrompt = "> ";

}  // namespace

std::string to_string(const Command command) {
  switch (command) {
    case Command::RowDown:
      return "row-down";
    case Command::RowUp:
      return "row-up";
    case Command::PageDown:
      return "page-down";
    case Command::PageUp:
      return "page-up";
    case Command::ColumnRight:
      return "column-right";
    case Command::ColumnLeft:
      return "column-left";
    case Command::Quit:
      return "quit";
  }
  return "unknown";
}

ViewportState apply(const ViewportState& state, const Command command,
                    const int64_t total_rows, const int total_columns,
                    const int64_t page_size) {
  ViewportState next = state;
  const int64_t last_row = std::max<int64_t>(total_rows - 1, 0);
  const int last_column = std::max(total_columns - 1, 0);

  switch (command) {
    case Command::RowDown:
      next.top_row = std::min(state.top_row + 1, last_row);
      break;
    case Command::RowUp:
      next.top_row = std::max<int64_t>(state.top_row - 1, 0);
      break;
    case Command::PageDown:
      if (page_size < total_rows && state.top_row < total_rows - page_size) {
        next.top_row =
            std::min(state.top_row + page_size, total_rows - page_size);
      }
      break;
    case Command::PageUp:
      if (state.top_row > 0) {
        next.top_row = std::max<int64_t>(state.top_row - page_size, 0);
      }
      break;
    case Command::ColumnRight:
      next.left_column = std::min(state.left_column + 1, last_column);
      break;
    case Command::ColumnLeft:
      next.left_column = std::max(state.left_column - 1, 0);
      break;
    case Command::Quit:
      break;
  }
  return next;
}

std::optional<Command> command_for_key(const KeyEvent& key) {
  switch (key.key) {
    case Key::Down:
      return Command::RowDown;
    case Key::Up:
      return Command::RowUp;
    case Key::PageDown:
      return Command::PageDown;
    case Key::PageUp:
      return Command::PageUp;
    case Key::Right:
      return Command::ColumnRight;
    case Key::Left:
      return Command::ColumnLeft;
    case Key::Interrupt:
    case Key::EndOfInput:
      return Command::Quit;
    case Key::Char:
      break;
    case Key::None:
      return std::nullopt;
  }
  switch (key.ch) {
    case 'j':
    case 'n':
      return Command::RowDown;
    case 'k':
    case 'p':
      return Command::RowUp;
    case 'l':
    case ' ':
      return Command::ColumnRight;
    case 'h':
    case 'b':
      return Command::ColumnLeft;
    case 'q':
    case 'Q':
      return Command::Quit;
    default:
      return std::nullopt;
  }
}

std::optional<Command> command_for_line(const std::string& line) {
  std::string word;
  for (char c : line) {
    if (!std::isspace(static_cast<unsigned char>(c))) {
      word += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
  }
  if (word == "n") return Command::RowDown;
  if (word == "p") return Command::RowUp;
  if (word == "f") return Command::PageDown;
  if (word == "b") return Command::PageUp;
  if (word == "r") return Command::ColumnRight;
  if (word == "l") return Command::ColumnLeft;
  if (word == "q") return Command::Quit;
  return std::nullopt;
}

ViewportController::ViewportController(std::unique_ptr<ChunkFetcher> fetcher,
                                       const TableRenderer& renderer,
                                       Terminal& terminal,
                                       const TerminalCapabilities caps,
                                       const MemoryProbe& memory,
                                       ViewOptions options, std::ostream& out)
    : fetcher_(std::move(fetcher)),
      renderer_(renderer),
      terminal_(terminal),
      caps_(caps),
      memory_(memory),
      options_(std::move(options)),
      out_(out) {
  // A page never exceeds the file, which keeps the paging sums in range
  options_.page_size = std::clamp<int64_t>(
      options_.page_size, 1, std::max<int64_t>(total_rows(), 1));
}

int64_t ViewportController::total_rows() const {
  return fetcher_->dataset().total_rows();
}

int ViewportController::total_columns() const {
  return fetcher_->projected_schema()->num_fields();
}

int64_t ViewportController::total_pages() const {
  const int64_t rows = total_rows();
  return rows / options_.page_size + (rows % options_.page_size != 0 ? 1 : 0);
}

arrow::Status ViewportController::render() { return render_state(state_); }

arrow::Status ViewportController::render_state(const ViewportState& state) {
  if (total_columns() == 0) {
    explain_empty();
    return arrow::Status::OK();
  }

  const int64_t end_row =
      state.top_row +
      std::min(options_.page_size, total_rows() - state.top_row);
  ARROW_ASSIGN_OR_RAISE(auto chunk,
                        fetcher_->fetch(RowRange{state.top_row, end_row}));

  const auto& layout = options_.layout;
  const auto visible =
      select_visible_columns(sample_columns(*chunk, layout),
                             state.left_column, terminal_.size().width, layout);

  terminal_.clear();
  out_ << "\n--- Showing rows " << state.top_row + 1 << "-" << end_row
       << " of " << group_digits(total_rows()) << " (Page "
       << state.top_row / options_.page_size + 1 << "/" << total_pages()
       << ") ---\n";
  out_ << navigation_line(state.left_column, visible.size()) << "\n\n";

  if (visible.empty()) {
    if (state.left_column < chunk->num_columns()) {
      out_ << "Column '" << chunk->schema()->field(state.left_column)->name()
           << "'";
    } else {
      out_ << "Column " << state.left_column + 1;
    }
    out_ << " does not fit in the terminal. Widen the window or scroll "
            "left.\n";
    return arrow::Status::OK();
  }

  const TextTable page = make_text_table(*chunk, visible, state.top_row,
                                         layout.max_column_width);
  out_ << renderer_.render(page, options_.table_format, true) << "\n";
  return arrow::Status::OK();
}

std::string ViewportController::navigation_line(
    const int first_column, const size_t visible_columns) const {
  std::string line = caps_.supports_unicode
                         ? "Navigation: ↑↓ Move one row | Page Up/Down: Move "
                           "full page | ←→ Scroll Columns | (Q)uit"
                         : "Navigation: Up/Down Move one row | Page Up/Down: "
                           "Move full page | Left/Right Scroll Columns | "
                           "(Q)uit";
  if (visible_columns == 0) {
    line += spdlog::fmt_lib::format(" | Columns {}-{} of {} (too wide)",
                                    first_column + 1, first_column + 1,
                                    total_columns());
  } else {
    line += spdlog::fmt_lib::format(
        " | Columns {}-{} of {}", first_column + 1,
        first_column + static_cast<int>(visible_columns), total_columns());
  }
  if (const double resident = memory_.resident_mb(); resident > 0) {
    line += spdlog::fmt_lib::format(" | Memory: {:.1f}MB", resident);
  }
  return line;
}

bool ViewportController::explain_empty() {
  if (total_columns() == 0) {
    out_ << "\nThis Parquet file has no columns.\n"
         << "It contains only row metadata without any data columns.\n";
    if (total_rows() > 0) {
      out_ << "Number of rows: " << group_digits(total_rows()) << "\n";
    }
    out_ << "\nNothing to display in interactive mode.\n";
    return true;
  }
  if (total_rows() == 0) {
    out_ << "\nDataset has " << total_columns()
         << " columns but no data rows.\n"
         << "\nNothing to navigate in interactive mode.\n";
    return true;
  }
  return false;
}

void ViewportController::report_failure(const arrow::Status& status) {
  // First line only; the page stays usable
  out_ << describe_error(status, fetcher_->dataset().path()).front() << "\n";
}

bool ViewportController::dispatch(const Command command,
                                  const bool always_render) {
  if (command == Command::Quit) {
    return false;
  }
  const ViewportState next = apply(state_, command, total_rows(),
                                   total_columns(), options_.page_size);
  if (next == state_ && !always_render) {
    return true;
  }
  log_debug("{}: row {} col {} -> row {} col {}", to_string(command),
            state_.top_row, state_.left_column, next.top_row,
            next.left_column);

  const auto status = render_state(next);
  if (!status.ok()) {
    log_error("Render failed at row {}: {}", next.top_row, status.ToString());
    report_failure(status);
    return true;
  }
  state_ = next;
  return true;
}

void ViewportController::run(LineReader& lines) {
  if (explain_empty()) {
    return;
  }
  if (auto status = render(); !status.ok()) {
    report_failure(status);
  }
  if (caps_.supports_live_keys) {
    run_live_keys();
  } else {
    run_line_mode(lines);
  }
}

void ViewportController::run_live_keys() {
  for (;;) {
    const auto command = command_for_key(terminal_.read_key());
    if (!command) {
      continue;
    }
    if (!dispatch(*command)) {
      break;
    }
  }
  out_ << "\nExiting interactive mode.\n";
}

void ViewportController::run_line_mode(LineReader& lines) {
  for (;;) {
    out_ << "\n" << kLineModeHelp << std::endl;
    const auto line = lines.read_line(kLineModePrompt);
    if (!line) {
      out_ << "\nDisplay stopped.\n";
      return;
    }
    const auto command = command_for_line(*line);
    if (command == Command::Quit) {
      break;
    }
    if (command) {
      dispatch(*command, true);
    } else if (auto status = render(); !status.ok()) {
      report_failure(status);
    }
  }
  out_ << "\nExiting interactive mode.\n";
}

}  // namespace pqlens
