#include "app.hpp"

Grid make_board() {
  Grid g;
  g.cells = {
    {"1", "2", "3"},
    {"4", "5", "6"},
    {"7", "8", "9"},
  };
  return g;
}

App::App(const AppConfig& cfg)
  : cfg_(cfg), grid_(make_board()), sel_(grid_.rows(), grid_.cols(), Cursor{0, 0}) {}

void App::run(ITerminal& term) {
  bool should_quit = false;
  while (!should_quit) {
    render(term);
    InputEvent ev = term.read_event();
    should_quit = !handle_event(ev);
  }
}

bool App::handle_event(const InputEvent& ev) {
  // resize and other non-key events only lead to the next redraw
  if (ev.type != InputEvent::Type::Key) return true;
  Action a = map_key(ev.key);
  if (a == Action::Quit) return false;
  apply(a);
  return true;
}

void App::apply(Action a) {
  switch (a) {
    case Action::NextRow: sel_.advance_row(); break;
    case Action::PrevRow: sel_.retreat_row(); break;
    case Action::NextColumn: sel_.advance_column(); break;
    case Action::PrevColumn: sel_.retreat_column(); break;
    case Action::Quit:
    case Action::None: break;
  }
}

FrameKind App::render(ITerminal& term) {
  return renderer_.render(term, grid_, sel_, cfg_);
}

const std::string& App::selected_value() const {
  return grid_.at(sel_.row(), sel_.col());
}
