#pragma once
/*
 * Palette
 *
 * Purpose: named accent palettes and the table colors derived from them.
 * Note: palettes are immutable tables; the chosen one travels in AppConfig.
 */
#include <string>
#include <vector>
#include "style.hpp"

struct Palette {
  const char* name;
  Color c400;
  Color c600;
};

struct TableColors {
  Color buffer_bg;
  Color row_fg;
  Color selected_row_fg;
  Color selected_column_fg;
  Color selected_cell_fg;
  Color normal_row;
  Color alt_row;
  Color warning_fg;
};

const std::vector<Palette>& palettes();
const Palette* find_palette(const std::string& name);
TableColors make_table_colors(const Palette& p);
