#pragma once
#include <cstdint>
/*
 * Input
 *
 * Purpose: structured key events and the key -> action table.
 * Extend: add rows to map_key; decoupled from the state it drives.
 */

enum class KeyCode { Char, Esc, Enter, Backspace, Up, Down, Left, Right, Other };
enum class KeyKind { Press, Release };

namespace KeyMod {
constexpr std::uint8_t None = 0;
constexpr std::uint8_t Ctrl = 1 << 0;
constexpr std::uint8_t Alt = 1 << 1;
}

struct KeyEvent {
  KeyCode code = KeyCode::Other;
  char ch = '\0';  // valid when code == Char
  std::uint8_t mods = KeyMod::None;
  KeyKind kind = KeyKind::Press;
};

struct InputEvent {
  enum class Type { Key, Resize, Other };
  Type type = Type::Other;
  KeyEvent key{};
};

enum class Action { None, Quit, NextRow, PrevRow, NextColumn, PrevColumn };

inline KeyEvent key_char(char c, std::uint8_t mods = KeyMod::None) { return KeyEvent{KeyCode::Char, c, mods, KeyKind::Press}; }
inline KeyEvent key_code(KeyCode code, std::uint8_t mods = KeyMod::None) { return KeyEvent{code, '\0', mods, KeyKind::Press}; }
inline InputEvent key_event(const KeyEvent& k) { return InputEvent{InputEvent::Type::Key, k}; }

Action map_key(const KeyEvent& k);
