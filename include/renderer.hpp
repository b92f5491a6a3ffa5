#ifndef RENDERER_HPP
#define RENDERER_HPP

#include <memory>
#include <string>
#include <vector>

#include "text_table.hpp"

namespace pqlens {

// Table styles accepted on the command line
const std::vector<std::string>& table_formats();

bool is_table_format(const std::string& name);

/**
 * Turns a page of formatted cells into text. Cells arrive truncated; a
 * renderer only pads and decorates them.
 */
class TableRenderer {
 public:
  virtual ~TableRenderer() = default;

  virtual std::string name() const = 0;

  /**
   * @param style one of table_formats(); renderers without styles ignore it
   * @param show_row_index prepend the logical row number column
   */
  virtual std::string render(const TextTable& table, const std::string& style,
                             bool show_row_index) const = 0;
};

// Box-drawn tables in the usual plain/simple/github/grid/... styles.
class GridRenderer : public TableRenderer {
 public:
  // Without unicode, fancy_grid falls back to grid.
  explicit GridRenderer(bool unicode = true) : unicode_(unicode) {}

  std::string name() const override { return "grid"; }

  std::string render(const TextTable& table, const std::string& style,
                     bool show_row_index) const override;

 private:
  bool unicode_;
};

// Space-aligned columns with no decoration, for pipes and dumb terminals.
class PlainRenderer : public TableRenderer {
 public:
  std::string name() const override { return "plain"; }

  std::string render(const TextTable& table, const std::string& style,
                     bool show_row_index) const override;
};

/**
 * @brief Chooses the renderer once for the session.
 *
 * @param plain_output forced by configuration
 */
std::unique_ptr<TableRenderer> make_renderer(bool plain_output,
                                             bool supports_unicode);

}  // namespace pqlens

#endif  // RENDERER_HPP
