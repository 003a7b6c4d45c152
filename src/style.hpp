#pragma once
/*
 * Style
 *
 * Purpose: backend-neutral colors and text styles.
 * Design: a Style is a patch; unset fg/bg keep what is underneath, modifiers accumulate.
 */
#include <cstdint>
#include <optional>
#include <vector>

enum class NamedColor : std::uint8_t { Black, Red, Green, Yellow, Blue, Magenta, Cyan, White };

struct Color {
  enum class Kind : std::uint8_t { Reset, Named, Rgb };
  Kind kind = Kind::Reset;
  NamedColor named = NamedColor::Black;
  std::uint8_t r = 0, g = 0, b = 0;

  static Color reset() { return Color{}; }
  static Color of(NamedColor c) { Color x; x.kind = Kind::Named; x.named = c; return x; }
  static Color rgb(std::uint32_t hex) {
    Color x;
    x.kind = Kind::Rgb;
    x.r = static_cast<std::uint8_t>((hex >> 16) & 0xff);
    x.g = static_cast<std::uint8_t>((hex >> 8) & 0xff);
    x.b = static_cast<std::uint8_t>(hex & 0xff);
    return x;
  }
};

bool operator==(const Color& a, const Color& b);
inline bool operator!=(const Color& a, const Color& b) { return !(a == b); }

namespace Modifier {
constexpr std::uint8_t None = 0;
constexpr std::uint8_t Reversed = 1 << 0;
constexpr std::uint8_t Bold = 1 << 1;
}

struct Style {
  std::optional<Color> fg;
  std::optional<Color> bg;
  std::uint8_t mods = Modifier::None;

  Style& with_fg(Color c) { fg = c; return *this; }
  Style& with_bg(Color c) { bg = c; return *this; }
  Style& add_modifier(std::uint8_t m) { mods |= m; return *this; }
  bool has(std::uint8_t m) const { return (mods & m) == m; }
};

bool operator==(const Style& a, const Style& b);
inline bool operator!=(const Style& a, const Style& b) { return !(a == b); }

Style patch(Style base, const Style& layer);
Style compose(Style base, const std::vector<Style>& layers);
