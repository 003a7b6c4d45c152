#pragma once
/*
 * Widgets
 *
 * Purpose: drawing primitives on top of ITerminal (paragraph, table).
 * Constraint: draw only inside the given Rect; never keep state between frames.
 */
#include <cstdint>
#include <string>
#include <vector>
#include "iterminal.hpp"

struct Paragraph {
  std::string text;
  Style style{};
  bool centered = true;
  bool wrap = true;
  bool trim = true;  // drop leading blanks on wrapped lines
};

std::vector<std::string> wrap_lines(const std::string& text, int width, bool trim);
void draw_paragraph(ITerminal& term, const Rect& area, const Paragraph& p);

enum class HighlightSpacing { Always, WhenSelected, Never };

// Which highlight layers were applied to a cell, for inspection.
namespace Layer {
constexpr std::uint8_t None = 0;
constexpr std::uint8_t Row = 1 << 0;
constexpr std::uint8_t Column = 1 << 1;
constexpr std::uint8_t Cell = 1 << 2;
}

struct CellView {
  std::string text;
  Style style{};
  std::uint8_t layers = Layer::None;
};

struct RowView {
  std::vector<CellView> cells;
  Style style{};  // fills the gaps between cells
  int height = 1;
  bool selected = false;
};

struct TableView {
  std::vector<RowView> rows;
  std::vector<int> widths;  // column percentages
  Style style{};
  int column_spacing = 1;
  int top_padding = 0;  // blank lines above cell content
  std::string highlight_symbol;
  HighlightSpacing highlight_spacing = HighlightSpacing::WhenSelected;
};

int reserved_symbol_width(const TableView& t);
void draw_table(ITerminal& term, const Rect& area, const TableView& t);
