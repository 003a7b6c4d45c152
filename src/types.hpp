#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs (Cursor/Grid).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <string>
#include <vector>

struct Cursor { int row = 0; int col = 0; };

inline bool operator==(const Cursor& a, const Cursor& b) { return a.row == b.row && a.col == b.col; }

// Fixed board of display values, row-major.
struct Grid {
  std::vector<std::vector<std::string>> cells;

  int rows() const { return static_cast<int>(cells.size()); }
  int cols() const { return cells.empty() ? 0 : static_cast<int>(cells[0].size()); }
  const std::string& at(int row, int col) const { return cells[row][col]; }
};

Grid make_board();
