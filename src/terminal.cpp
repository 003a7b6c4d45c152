#include "terminal.hpp"
#include <locale.h>
#include <cstdio>
#include "iterminal.hpp"

Terminal::Terminal() {
  acquire_ncurses();
  release_ = [this] { release_ncurses(); };
  active_ = true;
}

Terminal::Terminal(Hook acquire, Hook release) : release_(std::move(release)) {
  acquire();
  active_ = true;
}

Terminal::~Terminal() {
  restore();
}

void Terminal::restore() {
  if (!active_) return;
  active_ = false;
  if (release_) release_();
}

void Terminal::acquire_ncurses() {
  setlocale(LC_ALL, "");
  screen_ = newterm(nullptr, stdout, stdin);
  if (!screen_) throw TerminalError("can not initialize terminal (is TERM set?)");
  set_term(screen_);
  if (raw() == ERR || noecho() == ERR || keypad(stdscr, TRUE) == ERR) {
    release_ncurses();
    throw TerminalError("can not switch terminal to raw mode");
  }
  curs_set(0);  // not every terminal can hide the cursor
  set_escdelay(25);
}

void Terminal::release_ncurses() {
  if (!screen_) return;
  endwin();
  delscreen(screen_);
  screen_ = nullptr;
}
