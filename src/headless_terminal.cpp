#include "headless_terminal.hpp"
#include <algorithm>

HeadlessTerminal::HeadlessTerminal(int rows, int cols)
  : rows_(std::max(0, rows)), cols_(std::max(0, cols)), cells_(static_cast<size_t>(rows_) * cols_) {}

TermSize HeadlessTerminal::getSize() const { return {rows_, cols_}; }

void HeadlessTerminal::clear() {
  std::fill(cells_.begin(), cells_.end(), Cell{});
}

bool HeadlessTerminal::in_bounds(int row, int col) const {
  return row >= 0 && row < rows_ && col >= 0 && col < cols_;
}

void HeadlessTerminal::fill(const Rect& area, const Style& style) {
  for (int r = area.row; r < area.row + area.height; ++r)
    for (int c = area.col; c < area.col + area.width; ++c)
      if (in_bounds(r, c)) cells_[r * cols_ + c] = Cell{' ', style};
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text, const Style& style) {
  for (size_t i = 0; i < text.size(); ++i) {
    int c = col + static_cast<int>(i);
    if (in_bounds(row, c)) cells_[row * cols_ + c] = Cell{text[i], style};
  }
}

void HeadlessTerminal::refresh() { ++frames_; }

InputEvent HeadlessTerminal::read_event() {
  if (events_.empty()) throw TerminalError("headless: input queue exhausted");
  InputEvent ev = events_.front();
  events_.pop_front();
  return ev;
}

void HeadlessTerminal::push_event(const InputEvent& ev) { events_.push_back(ev); }

void HeadlessTerminal::push_key(const KeyEvent& k) { events_.push_back(key_event(k)); }

void HeadlessTerminal::resize(int rows, int cols) {
  rows_ = std::max(0, rows);
  cols_ = std::max(0, cols);
  cells_.assign(static_cast<size_t>(rows_) * cols_, Cell{});
  events_.push_back(InputEvent{InputEvent::Type::Resize, KeyEvent{}});
}

const HeadlessTerminal::Cell& HeadlessTerminal::cell(int row, int col) const {
  return cells_.at(static_cast<size_t>(row) * cols_ + col);
}

std::string HeadlessTerminal::line(int row) const {
  std::string s;
  if (row < 0 || row >= rows_) return s;
  s.reserve(cols_);
  for (int c = 0; c < cols_; ++c) s.push_back(cells_[row * cols_ + c].ch);
  return s;
}

bool HeadlessTerminal::contains(const std::string& text) const {
  for (int r = 0; r < rows_; ++r)
    if (line(r).find(text) != std::string::npos) return true;
  return false;
}
