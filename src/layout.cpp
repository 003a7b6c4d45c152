#include "layout.hpp"
#include <algorithm>

int resolve(const Constraint& c, int extent) {
  extent = std::max(0, extent);
  switch (c.type) {
    case Constraint::Type::Length:
    case Constraint::Type::Max:
      return std::clamp(c.value, 0, extent);
    case Constraint::Type::Percentage:
      return std::clamp(extent * c.value / 100, 0, extent);
  }
  return 0;
}

Rect center(const Rect& area, const Constraint& horizontal, const Constraint& vertical) {
  int w = resolve(horizontal, area.width);
  int h = resolve(vertical, area.height);
  Rect r;
  r.width = w;
  r.height = h;
  r.col = area.col + (std::max(0, area.width) - w) / 2;
  r.row = area.row + (std::max(0, area.height) - h) / 2;
  return r;
}

FrameLayout calculate_layout(const Rect& area, int width, int title_height, int table_height) {
  // Stack [Max(title), Max(table)] and center the pair vertically.
  int th = resolve(Constraint::max(title_height), area.height);
  int bh = resolve(Constraint::max(table_height), area.height - th);
  int top = area.row + (std::max(0, area.height) - th - bh) / 2;
  Rect title_band{top, area.col, th, area.width};
  Rect table_band{top + th, area.col, bh, area.width};
  FrameLayout out;
  out.title = center(title_band, Constraint::length(width), Constraint::length(title_height));
  out.table = center(table_band, Constraint::length(width), Constraint::length(table_height));
  return out;
}

std::vector<ColumnSpan> split_columns(int width, const std::vector<int>& percentages, int spacing, int reserved) {
  std::vector<ColumnSpan> out;
  int n = static_cast<int>(percentages.size());
  if (n == 0) return out;
  int avail = std::max(0, width - reserved - spacing * (n - 1));
  int col = std::min(std::max(0, reserved), std::max(0, width));
  for (int p : percentages) {
    int w = resolve(Constraint::percentage(p), avail);
    w = std::min(w, std::max(0, width - col));
    out.push_back(ColumnSpan{col, w});
    col = std::min(width, col + w + spacing);
  }
  return out;
}
