#include "terminal.hpp"
#include "ncurses_terminal.hpp"
#include "app.hpp"
#include <exception>
#include <iostream>
#include <string>

int main() {
  AppConfig cfg;
  std::string msg;
  if (!validate_config(cfg, msg)) {
    std::cerr << "gridpick: " << msg << "\n";
    return 2;
  }
  try {
    Terminal session;
    NcursesTerminal term;
    App app(cfg);
    app.run(term);
  } catch (const std::exception& e) {
    // session is gone by now, so the shell is usable again
    std::cerr << "gridpick: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
