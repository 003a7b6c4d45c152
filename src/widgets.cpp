#include "widgets.hpp"
#include <algorithm>
#include <sstream>

static std::string centered_slice(const std::string& s, int width) {
  if (width <= 0) return std::string();
  if (static_cast<int>(s.size()) >= width) return s.substr(0, width);
  int pad = (width - static_cast<int>(s.size())) / 2;
  return std::string(pad, ' ') + s;
}

std::vector<std::string> wrap_lines(const std::string& text, int width, bool trim) {
  std::vector<std::string> out;
  std::istringstream in(text);
  for (std::string raw; std::getline(in, raw);) {
    if (width <= 0) { out.push_back(raw); continue; }
    std::string cur;
    if (!trim) {
      size_t p = raw.find_first_not_of(' ');
      cur = raw.substr(0, std::min(p == std::string::npos ? raw.size() : p, static_cast<size_t>(width)));
    }
    bool fresh = true;  // nothing but indentation on cur yet
    std::istringstream words(raw);
    for (std::string word; words >> word;) {
      while (static_cast<int>(word.size()) > width) {
        if (!fresh || !cur.empty()) { out.push_back(cur); cur.clear(); fresh = true; }  // indentation goes first
        out.push_back(word.substr(0, width));
        word.erase(0, width);
      }
      if (word.empty()) continue;
      if (fresh && static_cast<int>(cur.size() + word.size()) <= width) {
        cur += word;
      } else if (!fresh && static_cast<int>(cur.size() + 1 + word.size()) <= width) {
        cur += " " + word;
      } else {
        out.push_back(cur);
        cur = word;
      }
      fresh = false;
    }
    out.push_back(cur);
  }
  return out;
}

void draw_paragraph(ITerminal& term, const Rect& area, const Paragraph& p) {
  if (area.width <= 0 || area.height <= 0) return;
  std::vector<std::string> lines;
  if (p.wrap) {
    lines = wrap_lines(p.text, area.width, p.trim);
  } else {
    std::istringstream in(p.text);
    for (std::string l; std::getline(in, l);) lines.push_back(l);
  }
  int n = std::min(area.height, static_cast<int>(lines.size()));
  for (int i = 0; i < n; ++i) {
    std::string s = p.centered ? centered_slice(lines[i], area.width) : lines[i].substr(0, area.width);
    term.draw_text(area.row + i, area.col, s, p.style);
  }
}

int reserved_symbol_width(const TableView& t) {
  bool any_selected = std::any_of(t.rows.begin(), t.rows.end(), [](const RowView& r){ return r.selected; });
  switch (t.highlight_spacing) {
    case HighlightSpacing::Always: return static_cast<int>(t.highlight_symbol.size());
    case HighlightSpacing::WhenSelected: return any_selected ? static_cast<int>(t.highlight_symbol.size()) : 0;
    case HighlightSpacing::Never: return 0;
  }
  return 0;
}

void draw_table(ITerminal& term, const Rect& area, const TableView& t) {
  if (area.width <= 0 || area.height <= 0) return;
  term.fill(area, t.style);
  int reserved = reserved_symbol_width(t);
  auto spans = split_columns(area.width, t.widths, t.column_spacing, reserved);
  int y = area.row;
  int bottom = area.row + area.height;
  for (const auto& row : t.rows) {
    if (y >= bottom) break;
    int h = std::min(row.height, bottom - y);
    term.fill(Rect{y, area.col, h, area.width}, row.style);
    if (row.selected && reserved > 0 && row.height > t.top_padding)
      term.draw_text(y + std::min(t.top_padding, h - 1), area.col, t.highlight_symbol, row.style);
    size_t n = std::min(spans.size(), row.cells.size());
    for (size_t j = 0; j < n; ++j) {
      const CellView& cell = row.cells[j];
      Rect cr{y, area.col + spans[j].col, h, spans[j].width};
      term.fill(cr, cell.style);
      int text_row = y + t.top_padding;
      if (text_row < y + h) term.draw_text(text_row, cr.col, centered_slice(cell.text, cr.width), cell.style);
    }
    y += row.height;
  }
}
