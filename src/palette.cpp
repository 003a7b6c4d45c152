#include "palette.hpp"

namespace {
// Tailwind slate shades shared by every palette.
const Color kSlate950 = Color::rgb(0x020617);
const Color kSlate900 = Color::rgb(0x0f172a);
const Color kSlate200 = Color::rgb(0xe2e8f0);
}

const std::vector<Palette>& palettes() {
  static const std::vector<Palette> all = {
    {"blue",    Color::rgb(0x60a5fa), Color::rgb(0x2563eb)},
    {"emerald", Color::rgb(0x34d399), Color::rgb(0x059669)},
    {"indigo",  Color::rgb(0x818cf8), Color::rgb(0x4f46e5)},
    {"red",     Color::rgb(0xf87171), Color::rgb(0xdc2626)},
  };
  return all;
}

const Palette* find_palette(const std::string& name) {
  for (const auto& p : palettes()) if (name == p.name) return &p;
  return nullptr;
}

TableColors make_table_colors(const Palette& p) {
  TableColors c;
  c.buffer_bg = kSlate950;
  c.row_fg = kSlate200;
  c.selected_row_fg = p.c400;
  c.selected_column_fg = p.c400;
  c.selected_cell_fg = p.c600;
  c.normal_row = kSlate950;
  c.alt_row = kSlate900;
  c.warning_fg = Color::of(NamedColor::Red);
  return c;
}
