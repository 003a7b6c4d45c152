#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for automated tests and render verification.
 * Records a char/style grid per frame and replays a scripted event queue.
 */
#include <deque>
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  struct Cell {
    char ch = ' ';
    Style style{};
  };

  HeadlessTerminal(int rows, int cols);

  TermSize getSize() const override;
  void clear() override;
  void fill(const Rect& area, const Style& style) override;
  void draw_text(int row, int col, const std::string& text, const Style& style) override;
  void refresh() override;
  InputEvent read_event() override;

  void push_event(const InputEvent& ev);
  void push_key(const KeyEvent& k);
  // Changes the size and queues the matching resize event.
  void resize(int rows, int cols);

  const Cell& cell(int row, int col) const;
  std::string line(int row) const;
  bool contains(const std::string& text) const;
  int frames() const { return frames_; }
  size_t pending_events() const { return events_.size(); }

private:
  bool in_bounds(int row, int col) const;

  int rows_;
  int cols_;
  std::vector<Cell> cells_;
  std::deque<InputEvent> events_;
  int frames_ = 0;
};
