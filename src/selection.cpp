#include "selection.hpp"
#include <stdexcept>
#include <string>

Selection::Selection(int rows, int cols, Cursor start) : rows_(rows), cols_(cols), cur_(start) {
  if (rows_ <= 0 || cols_ <= 0)
    throw std::invalid_argument("selection: grid must be at least 1x1, got " + std::to_string(rows_) + "x" + std::to_string(cols_));
  if (cur_.row < 0 || cur_.row >= rows_ || cur_.col < 0 || cur_.col >= cols_)
    throw std::invalid_argument("selection: start (" + std::to_string(cur_.row) + "," + std::to_string(cur_.col) + ") out of bounds");
}

void Selection::advance_row() {
  if (cur_.row == rows_ - 1) cur_.row = 0;
  else cur_.row += 1;
}

void Selection::retreat_row() {
  if (cur_.row == 0) cur_.row = rows_ - 1;
  else cur_.row -= 1;
}

void Selection::advance_column() {
  if (cur_.col == cols_ - 1) cur_.col = 0;
  else cur_.col += 1;
}

void Selection::retreat_column() {
  if (cur_.col == 0) cur_.col = cols_ - 1;
  else cur_.col -= 1;
}
