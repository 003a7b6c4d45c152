#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing and input.
 * Note: initialization/teardown is managed by Terminal RAII wrapper.
 * Colors: RGB is sent as-is to direct-color terminals, snapped to the nearest
 * xterm-256 cube or grayscale entry, or to 8 ANSI colors on small terminals.
 */
#include <map>
#include <utility>
#include "iterminal.hpp"
#include <ncurses.h>

struct ColorCaps {
  int colors = 8;               // COLORS
  bool direct = false;          // terminfo RGB flag: color numbers are 0xRRGGBB
  bool default_colors = false;  // -1 allowed as "terminal default"
};

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  TermSize getSize() const override;
  void clear() override;
  void fill(const Rect& area, const Style& style) override;
  void draw_text(int row, int col, const std::string& text, const Style& style) override;
  void refresh() override;
  InputEvent read_event() override;

private:
  int pair_for(int fg, int bg);
  attr_t attrs_for(const Style& style);

  bool colors_ = false;
  ColorCaps caps_{};
  std::map<std::pair<int, int>, int> pairs_;
  int next_pair_ = 1;
};

KeyEvent decode_key(int ch);
int curses_color(const std::optional<Color>& c, bool foreground, const ColorCaps& caps);
