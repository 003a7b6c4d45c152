#include "config.hpp"

bool validate_config(AppConfig& cfg, std::string& msg) {
  const Palette* p = find_palette(cfg.palette);
  if (!p) {
    msg = "unknown palette: " + cfg.palette + " (expected one of:";
    for (const auto& known : palettes()) msg += std::string(" ") + known.name;
    msg += ")";
    return false;
  }
  if (cfg.min_width <= 0 || cfg.min_height <= 0) {
    msg = "minimum terminal size must be positive, got " + std::to_string(cfg.min_width) + "x" + std::to_string(cfg.min_height);
    return false;
  }
  cfg.colors = make_table_colors(*p);
  msg.clear();
  return true;
}
