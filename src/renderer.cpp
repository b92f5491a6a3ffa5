#include "renderer.hpp"

#include <algorithm>
#include <sstream>

#include "logger.hpp"

namespace pqlens {

namespace {

struct Line {
  std::string begin;
  std::string fill;
  std::string sep;
  std::string end;
  bool enabled = true;
};

struct Row {
  std::string begin;
  std::string sep;
  std::string end;
};

struct Style {
  Line above;
  Line below_header;
  Line between_rows;
  Line below;
  Row header;
  Row data;
  int padding = 1;
  bool alignment_colons = false;
};

const Line kNoLine{"", "", "", "", false};

Style style_for(const std::string& name, bool unicode) {
  if (name == "plain") {
    return {kNoLine, kNoLine, kNoLine, kNoLine, {"", "  ", ""},
            {"", "  ", ""}, 0};
  }
  if (name == "simple") {
    return {kNoLine, {"", "-", "  ", ""}, kNoLine, kNoLine, {"", "  ", ""},
            {"", "  ", ""}, 0};
  }
  if (name == "github" || name == "pipe") {
    return {kNoLine, {"|", "-", "|", "|"}, kNoLine, kNoLine,
            {"|", "|", "|"}, {"|", "|", "|"}, 1, name == "pipe"};
  }
  if (name == "orgtbl") {
    return {kNoLine, {"|", "-", "+", "|"}, kNoLine, kNoLine,
            {"|", "|", "|"}, {"|", "|", "|"}, 1};
  }
  if (name == "jira") {
    return {kNoLine, kNoLine, kNoLine, kNoLine, {"||", "||", "||"},
            {"|", "|", "|"}, 1};
  }
  if (name == "fancy_grid" && unicode) {
    return {{"╒", "═", "╤", "╕"}, {"╞", "═", "╪", "╡"},
            {"├", "─", "┼", "┤"}, {"╘", "═", "╧", "╛"},
            {"│", "│", "│"},      {"│", "│", "│"},
            1};
  }
  // grid, and fancy_grid on terminals without unicode
  return {{"+", "-", "+", "+"}, {"+", "=", "+", "+"}, {"+", "-", "+", "+"},
          {"+", "-", "+", "+"}, {"|", "|", "|"},      {"|", "|", "|"},
          1};
}

std::string repeat(const std::string& unit, size_t count) {
  std::string out;
  out.reserve(unit.size() * count);
  for (size_t i = 0; i < count; ++i) out += unit;
  return out;
}

std::string pad(const std::string& text, size_t width, bool right) {
  const size_t w = display_width(text);
  if (w >= width) return text;
  const std::string fill(width - w, ' ');
  return right ? fill + text : text + fill;
}

// Header and body cells with the optional row-number column in front.
struct Grid {
  std::vector<std::string> header;
  std::vector<std::vector<std::string>> body;
  std::vector<bool> right;
  std::vector<size_t> widths;
};

Grid layout(const TextTable& table, bool show_row_index) {
  Grid grid;
  if (show_row_index) {
    grid.header.emplace_back("");
    grid.right.push_back(true);
  }
  grid.header.insert(grid.header.end(), table.headers.begin(),
                     table.headers.end());
  grid.right.insert(grid.right.end(), table.right_align.begin(),
                    table.right_align.end());

  grid.body.reserve(table.num_rows());
  for (size_t r = 0; r < table.num_rows(); ++r) {
    std::vector<std::string> row;
    row.reserve(grid.header.size());
    if (show_row_index) {
      row.push_back(std::to_string(table.first_row + static_cast<int64_t>(r)));
    }
    row.insert(row.end(), table.rows[r].begin(), table.rows[r].end());
    row.resize(grid.header.size());
    grid.body.push_back(std::move(row));
  }

  grid.widths.assign(grid.header.size(), 0);
  for (size_t c = 0; c < grid.header.size(); ++c) {
    grid.widths[c] = display_width(grid.header[c]);
    for (const auto& row : grid.body) {
      grid.widths[c] = std::max(grid.widths[c], display_width(row[c]));
    }
  }
  return grid;
}

void write_line(std::ostringstream& out, const Line& line, const Grid& grid,
                const Style& style) {
  if (!line.enabled) return;
  out << line.begin;
  for (size_t c = 0; c < grid.widths.size(); ++c) {
    if (c > 0) out << line.sep;
    const size_t span = grid.widths[c] + 2 * style.padding;
    if (style.alignment_colons && span >= 2) {
      out << (grid.right[c] ? repeat(line.fill, span - 1) + ":"
                            : ":" + repeat(line.fill, span - 1));
    } else {
      out << repeat(line.fill, span);
    }
  }
  out << line.end << '\n';
}

void write_row(std::ostringstream& out, const Row& row,
               const std::vector<std::string>& cells, const Grid& grid,
               const Style& style) {
  const std::string padding(style.padding, ' ');
  out << row.begin;
  for (size_t c = 0; c < cells.size(); ++c) {
    if (c > 0) out << row.sep;
    out << padding << pad(cells[c], grid.widths[c], grid.right[c]) << padding;
  }
  out << row.end << '\n';
}

}  // namespace

const std::vector<std::string>& table_formats() {
  static const std::vector<std::string> formats = {
      "plain", "simple", "github", "grid", "fancy_grid", "pipe", "orgtbl",
      "jira"};
  return formats;
}

bool is_table_format(const std::string& name) {
  const auto& formats = table_formats();
  return std::find(formats.begin(), formats.end(), name) != formats.end();
}

std::string GridRenderer::render(const TextTable& table,
                                 const std::string& style_name,
                                 const bool show_row_index) const {
  const Grid grid = layout(table, show_row_index);
  if (grid.header.empty()) {
    return "";
  }
  const Style style = style_for(style_name, unicode_);

  std::ostringstream out;
  write_line(out, style.above, grid, style);
  write_row(out, style.header, grid.header, grid, style);
  write_line(out, style.below_header, grid, style);
  for (size_t r = 0; r < grid.body.size(); ++r) {
    if (r > 0) write_line(out, style.between_rows, grid, style);
    write_row(out, style.data, grid.body[r], grid, style);
  }
  write_line(out, style.below, grid, style);

  std::string text = out.str();
  if (!text.empty() && text.back() == '\n') text.pop_back();
  return text;
}

std::string PlainRenderer::render(const TextTable& table,
                                  const std::string& /*style*/,
                                  const bool show_row_index) const {
  const Grid grid = layout(table, show_row_index);
  if (grid.header.empty()) {
    return "";
  }

  std::ostringstream out;
  auto emit = [&](const std::vector<std::string>& cells) {
    std::string line;
    for (size_t c = 0; c < cells.size(); ++c) {
      if (c > 0) line += "  ";
      // Row numbers hug the left edge, values hug the right.
      const bool index_column = show_row_index && c == 0;
      line += pad(cells[c], grid.widths[c], !index_column);
    }
    while (!line.empty() && line.back() == ' ') line.pop_back();
    out << line << '\n';
  };

  emit(grid.header);
  for (const auto& row : grid.body) emit(row);

  std::string text = out.str();
  if (!text.empty()) text.pop_back();
  return text;
}

std::unique_ptr<TableRenderer> make_renderer(const bool plain_output,
                                             const bool supports_unicode) {
  if (plain_output) {
    log_debug("Using plain renderer");
    return std::make_unique<PlainRenderer>();
  }
  log_debug("Using grid renderer (unicode={})", supports_unicode);
  return std::make_unique<GridRenderer>(supports_unicode);
}

}  // namespace pqlens
