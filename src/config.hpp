#pragma once

/*here you can choose the startup palette and the minimum terminal size*/

#ifndef GRIDPICK_PALETTE
#define GRIDPICK_PALETTE "blue"
#endif

#ifndef GRIDPICK_MIN_WIDTH
#define GRIDPICK_MIN_WIDTH 30
#endif

#ifndef GRIDPICK_MIN_HEIGHT
#define GRIDPICK_MIN_HEIGHT 10
#endif

#include <string>
#include "palette.hpp"

struct AppConfig {
  std::string palette = GRIDPICK_PALETTE;
  int min_width = GRIDPICK_MIN_WIDTH;
  int min_height = GRIDPICK_MIN_HEIGHT;
  std::string title = "You VS Bot";
  TableColors colors{};  // filled by validate_config
};

// Resolves the palette into colors; returns false with msg on failure.
bool validate_config(AppConfig& cfg, std::string& msg);
