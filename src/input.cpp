#include "input.hpp"

static bool is_char(const KeyEvent& k, char c) { return k.code == KeyCode::Char && k.ch == c; }

Action map_key(const KeyEvent& k) {
  if (k.kind != KeyKind::Press) return Action::None;
  if (is_char(k, 'q') || k.code == KeyCode::Esc) return Action::Quit;
  if (k.mods == KeyMod::Ctrl && is_char(k, 'c')) return Action::Quit;
  if (is_char(k, 's') || k.code == KeyCode::Down) return Action::NextRow;
  if (is_char(k, 'w') || k.code == KeyCode::Up) return Action::PrevRow;
  if (is_char(k, 'd') || k.code == KeyCode::Right) return Action::NextColumn;
  if (is_char(k, 'a') || k.code == KeyCode::Left) return Action::PrevColumn;
  return Action::None;
}
