#pragma once
/*
 * Terminal
 *
 * Purpose: RAII wrapper around ncurses init/teardown.
 * Usage: construct in main; destructor restores terminal.
 * Note: manages terminal modes (raw/noecho/keypad), not rendering.
 * restore() runs the release step at most once, whoever calls it first.
 */
#include <functional>
#include <utility>
#include <ncurses.h>

class Terminal {
public:
  using Hook = std::function<void()>;

  Terminal();
  // Custom acquire/release steps; acquire must throw on failure and leave nothing behind.
  Terminal(Hook acquire, Hook release);
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;

  void restore();
  bool active() const { return active_; }

private:
  void acquire_ncurses();
  void release_ncurses();

  Hook release_;
  SCREEN* screen_ = nullptr;
  bool active_ = false;
};
