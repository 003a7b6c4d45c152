#include "style.hpp"

bool operator==(const Color& a, const Color& b) {
  if (a.kind != b.kind) return false;
  switch (a.kind) {
    case Color::Kind::Reset: return true;
    case Color::Kind::Named: return a.named == b.named;
    case Color::Kind::Rgb: return a.r == b.r && a.g == b.g && a.b == b.b;
  }
  return false;
}

bool operator==(const Style& a, const Style& b) {
  return a.fg == b.fg && a.bg == b.bg && a.mods == b.mods;
}

Style patch(Style base, const Style& layer) {
  if (layer.fg) base.fg = layer.fg;
  if (layer.bg) base.bg = layer.bg;
  base.mods |= layer.mods;
  return base;
}

Style compose(Style base, const std::vector<Style>& layers) {
  for (const auto& l : layers) base = patch(base, l);
  return base;
}
