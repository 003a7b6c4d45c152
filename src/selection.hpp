#pragma once
/*
 * Selection
 *
 * Purpose: 2D cursor over an M x N grid with wrap-around moves.
 * Invariant: 0 <= row < rows, 0 <= col < cols at all times; every move is total.
 */
#include "types.hpp"

class Selection {
public:
  Selection(int rows, int cols, Cursor start = {});

  void advance_row();
  void retreat_row();
  void advance_column();
  void retreat_column();

  int row() const { return cur_.row; }
  int col() const { return cur_.col; }
  const Cursor& cursor() const { return cur_; }
  int rows() const { return rows_; }
  int cols() const { return cols_; }

private:
  int rows_;
  int cols_;
  Cursor cur_;
};
