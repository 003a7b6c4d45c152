#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, styled draw, refresh, input).
 * Goal: decouple from concrete impls (ncurses/headless/etc), enable testing.
 */
#include <stdexcept>
#include <string>
#include "input.hpp"
#include "layout.hpp"
#include "style.hpp"

struct TermSize { int rows; int cols; };

// Terminal acquisition or input-read failure; always fatal.
class TerminalError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize getSize() const = 0;
  virtual void clear() = 0;
  virtual void fill(const Rect& area, const Style& style) = 0;
  virtual void draw_text(int row, int col, const std::string& text, const Style& style) = 0;
  virtual void refresh() = 0;
  // Blocks until the next event; throws TerminalError on I/O failure.
  virtual InputEvent read_event() = 0;
};
