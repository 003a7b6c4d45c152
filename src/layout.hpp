#pragma once
/*
 * Layout
 *
 * Purpose: rectangle math for one frame (centering, stacking, table columns).
 * Constraint: pure functions; results are always clipped to the parent area.
 */
#include <vector>

struct Rect {
  int row = 0;
  int col = 0;
  int height = 0;
  int width = 0;
};

inline bool operator==(const Rect& a, const Rect& b) {
  return a.row == b.row && a.col == b.col && a.height == b.height && a.width == b.width;
}

struct Constraint {
  enum class Type { Length, Percentage, Max };
  Type type = Type::Length;
  int value = 0;

  static Constraint length(int n) { return {Type::Length, n}; }
  static Constraint percentage(int p) { return {Type::Percentage, p}; }
  static Constraint max(int n) { return {Type::Max, n}; }
};

struct ColumnSpan {
  int col = 0;    // offset from the table's left edge
  int width = 0;
};

struct FrameLayout {
  Rect title;
  Rect table;
};

int resolve(const Constraint& c, int extent);
Rect center(const Rect& area, const Constraint& horizontal, const Constraint& vertical);
FrameLayout calculate_layout(const Rect& area, int width, int title_height, int table_height);
std::vector<ColumnSpan> split_columns(int width, const std::vector<int>& percentages, int spacing, int reserved);
