#pragma once
/*
 * App
 *
 * Purpose: owns the board, the selection and the config; runs draw/read/apply.
 * Flow: render -> block on one event -> update selection -> repeat until quit.
 */
#include <string>
#include "config.hpp"
#include "input.hpp"
#include "iterminal.hpp"
#include "renderer.hpp"
#include "selection.hpp"
#include "types.hpp"

class App {
public:
  explicit App(const AppConfig& cfg);
  // Returns once a quit key is read; I/O errors propagate.
  void run(ITerminal& term);

  // Returns false when the event asks to quit.
  bool handle_event(const InputEvent& ev);
  void apply(Action a);
  FrameKind render(ITerminal& term);

  const Grid& grid() const { return grid_; }
  const Selection& selection() const { return sel_; }
  const std::string& selected_value() const;

private:
  AppConfig cfg_;
  Grid grid_;
  Selection sel_;
  Renderer renderer_;
};
