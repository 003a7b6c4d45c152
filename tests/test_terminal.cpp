#include "terminal.hpp"
#include "app.hpp"
#include "headless_terminal.hpp"
#include <cassert>
#include <string>

static AppConfig make_config() {
  AppConfig cfg;
  std::string msg;
  bool ok = validate_config(cfg, msg);
  assert(ok);
  (void)ok;
  return cfg;
}

static void run_restore_once_tests() {
  int acquired = 0, released = 0;
  {
    Terminal session([&]{ ++acquired; }, [&]{ ++released; });
    assert(session.active());
    assert(acquired == 1 && released == 0);
    session.restore();
    assert(!session.active());
    session.restore();
    assert(released == 1);
  }
  assert(released == 1);  // destructor after restore() is a no-op
}

static void run_acquire_failure_tests() {
  int released = 0;
  bool threw = false;
  try {
    Terminal session([]{ throw TerminalError("no tty"); }, [&]{ ++released; });
  } catch (const TerminalError& e) {
    threw = true;
    assert(std::string(e.what()) == "no tty");
  }
  assert(threw);
  assert(released == 0);
}

static void run_quit_restores_tests() {
  for (KeyEvent quit : {key_char('q'), key_code(KeyCode::Esc), key_char('c', KeyMod::Ctrl)}) {
    int released = 0;
    {
      Terminal session([]{}, [&]{ ++released; });
      HeadlessTerminal t(24, 80);
      t.push_key(key_code(KeyCode::Up));
      t.push_key(quit);
      App app(make_config());
      app.run(t);
      assert(t.pending_events() == 0);
      assert(app.selected_value() == "7");
      session.restore();
      session.restore();
    }
    assert(released == 1);
  }
}

static void run_error_restores_tests() {
  int released = 0;
  bool threw = false;
  try {
    Terminal session([]{}, [&]{ ++released; });
    HeadlessTerminal t(24, 80);  // empty queue: first read fails
    App app(make_config());
    app.run(t);
  } catch (const TerminalError&) {
    threw = true;
    assert(released == 1);  // unwound before the handler runs
  }
  assert(threw);
  assert(released == 1);
}

int main() {
  run_restore_once_tests();
  run_acquire_failure_tests();
  run_quit_restores_tests();
  run_error_restores_tests();
  return 0;
}
