#include "renderer.hpp"
#include <utility>
#include <vector>

TableView build_table_view(const Grid& grid, const Selection& sel, const TableColors& colors) {
  const Style table_style = Style().with_bg(colors.buffer_bg);
  const Style row_hl = Style().add_modifier(Modifier::Reversed).with_fg(colors.selected_row_fg);
  const Style col_hl = Style().with_fg(colors.selected_column_fg);
  const Style cell_hl = Style().add_modifier(Modifier::Reversed).with_fg(colors.selected_cell_fg);

  TableView t;
  t.style = table_style;
  t.column_spacing = 1;
  t.top_padding = 1;
  t.highlight_spacing = HighlightSpacing::Always;
  int n = grid.cols();
  t.widths.assign(n, n > 0 ? 100 / n : 0);

  for (int i = 0; i < grid.rows(); ++i) {
    // zebra stripes by row parity, independent of the cursor
    Style base = Style().with_fg(colors.row_fg).with_bg(i % 2 == 0 ? colors.normal_row : colors.alt_row);
    bool row_selected = (i == sel.row());
    RowView rv;
    rv.height = kRowHeight;
    rv.selected = row_selected;
    rv.style = row_selected ? compose(table_style, {base, row_hl}) : patch(table_style, base);
    for (int j = 0; j < n; ++j) {
      bool col_selected = (j == sel.col());
      std::vector<Style> layers{base};
      CellView cv;
      cv.text = grid.at(i, j);
      if (row_selected) { layers.push_back(row_hl); cv.layers |= Layer::Row; }
      if (col_selected) { layers.push_back(col_hl); cv.layers |= Layer::Column; }
      if (row_selected && col_selected) { layers.push_back(cell_hl); cv.layers |= Layer::Cell; }
      cv.style = compose(table_style, layers);
      rv.cells.push_back(std::move(cv));
    }
    t.rows.push_back(std::move(rv));
  }
  return t;
}

std::string too_small_message(const AppConfig& cfg) {
  return "Terminal size too small.\nMinimum size is " + std::to_string(cfg.min_width) + "x" + std::to_string(cfg.min_height) + ".";
}

FrameKind Renderer::render(ITerminal& term, const Grid& grid, const Selection& sel, const AppConfig& cfg) {
  TermSize sz = term.getSize();
  Rect area{0, 0, sz.rows, sz.cols};
  term.clear();

  if (sz.cols < cfg.min_width || sz.rows < cfg.min_height) {
    Paragraph warn;
    warn.text = too_small_message(cfg);
    warn.style = Style().with_fg(cfg.colors.warning_fg);
    draw_paragraph(term, center(area, Constraint::percentage(100), Constraint::length(2)), warn);
    term.refresh();
    return FrameKind::TooSmall;
  }

  FrameLayout l = calculate_layout(area, kBoardWidth, kTitleHeight, grid.rows() * kRowHeight);
  Paragraph title;
  title.text = cfg.title;
  title.wrap = false;
  draw_paragraph(term, l.title, title);
  draw_table(term, l.table, build_table_view(grid, sel, cfg.colors));
  term.refresh();
  return FrameKind::Board;
}
