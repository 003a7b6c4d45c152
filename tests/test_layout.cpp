#include "layout.hpp"
#include <cassert>
#include <vector>

static void run_center_tests() {
  Rect screen{0, 0, 24, 80};
  Rect r = center(screen, Constraint::length(30), Constraint::length(9));
  assert((r == Rect{7, 25, 9, 30}));

  // child larger than parent is clipped to it
  r = center(Rect{2, 3, 4, 10}, Constraint::length(30), Constraint::length(9));
  assert((r == Rect{2, 3, 4, 10}));

  r = center(Rect{0, 0, 8, 20}, Constraint::percentage(100), Constraint::length(2));
  assert((r == Rect{3, 0, 2, 20}));

  r = center(Rect{0, 0, 1, 20}, Constraint::percentage(100), Constraint::length(2));
  assert(r.height == 1 && r.row == 0);

  assert(resolve(Constraint::percentage(50), 9) == 4);
  assert(resolve(Constraint::max(9), 4) == 4);
  assert(resolve(Constraint::length(5), -3) == 0);
}

static void run_frame_layout_tests() {
  FrameLayout l = calculate_layout(Rect{0, 0, 24, 80}, 30, 1, 9);
  assert((l.title == Rect{7, 25, 1, 30}));
  assert((l.table == Rect{8, 25, 9, 30}));

  // exactly the minimum size: no slack anywhere
  l = calculate_layout(Rect{0, 0, 10, 30}, 30, 1, 9);
  assert((l.title == Rect{0, 0, 1, 30}));
  assert((l.table == Rect{1, 0, 9, 30}));

  // odd slack goes below
  l = calculate_layout(Rect{0, 0, 11, 31}, 30, 1, 9);
  assert(l.title.row == 0 && l.table.row == 1);
  assert(l.title.col == 0 && l.table.col == 0);
}

static void run_column_tests() {
  std::vector<ColumnSpan> cs = split_columns(30, {33, 33, 33}, 1, 0);
  assert(cs.size() == 3);
  assert(cs[0].col == 0 && cs[1].col == 10 && cs[2].col == 20);
  for (const auto& c : cs) assert(c.width == 9);

  // reserved highlight column shifts everything right
  cs = split_columns(30, {33, 33, 33}, 1, 3);
  assert(cs[0].col == 3);
  assert(cs[0].width == 8);
  assert(cs[2].col + cs[2].width <= 30);

  cs = split_columns(2, {33, 33, 33}, 1, 0);
  for (const auto& c : cs) assert(c.col + c.width <= 2);

  assert(split_columns(30, {}, 1, 0).empty());
}

int main() {
  run_center_tests();
  run_frame_layout_tests();
  run_column_tests();
  return 0;
}
