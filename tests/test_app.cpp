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

static void run_scenario_tests() {
  App app(make_config());
  assert(app.selection().cursor() == (Cursor{0, 0}));
  assert(app.selected_value() == "1");

  HeadlessTerminal t(24, 80);
  t.push_key(key_code(KeyCode::Down));
  t.push_key(key_code(KeyCode::Down));
  t.push_key(key_code(KeyCode::Right));
  t.push_key(key_char('q'));
  app.run(t);
  assert(app.selection().cursor() == (Cursor{2, 1}));
  assert(app.selected_value() == "8");
  assert(t.frames() == 4);  // one redraw before every read
  assert(t.pending_events() == 0);

  // last frame shows the cursor on "8"
  assert(t.cell(15, 39).ch == '8');
  assert(t.cell(15, 39).style.has(Modifier::Reversed));
}

static void run_wasd_tests() {
  App app(make_config());
  HeadlessTerminal t(24, 80);
  for (char ch : std::string("swwdaa")) t.push_key(key_char(ch));
  t.push_key(key_code(KeyCode::Esc));
  app.run(t);
  // s:(1,0) w:(0,0) w:(2,0) d:(2,1) a:(2,0) a:(2,2)
  assert(app.selection().cursor() == (Cursor{2, 2}));
  assert(app.selected_value() == "9");
}

static void run_quit_tests() {
  for (KeyEvent quit : {key_char('q'), key_code(KeyCode::Esc), key_char('c', KeyMod::Ctrl)}) {
    App app(make_config());
    HeadlessTerminal t(24, 80);
    t.push_key(key_char('s'));
    t.push_key(quit);
    t.push_key(key_char('s'));  // never read
    app.run(t);
    assert(app.selection().row() == 1);
    assert(t.pending_events() == 1);
  }
}

static void run_ignored_event_tests() {
  App app(make_config());
  KeyEvent release = key_char('s');
  release.kind = KeyKind::Release;
  assert(app.handle_event(key_event(release)));
  assert(app.handle_event(key_event(key_char('c'))));
  assert(app.handle_event(key_event(key_char('x'))));
  assert(app.handle_event(InputEvent{InputEvent::Type::Other, KeyEvent{}}));
  assert(app.handle_event(InputEvent{InputEvent::Type::Resize, KeyEvent{}}));
  assert(app.selection().cursor() == (Cursor{0, 0}));
  assert(!app.handle_event(key_event(key_code(KeyCode::Esc))));

  app.apply(Action::PrevRow);
  app.apply(Action::PrevColumn);
  assert(app.selected_value() == "9");
  app.apply(Action::None);
  assert(app.selected_value() == "9");
}

static void run_resize_tests() {
  App app(make_config());
  HeadlessTerminal t(24, 80);
  t.push_key(key_char('d'));
  t.resize(8, 20);
  t.push_key(key_char('q'));
  app.run(t);
  assert(t.frames() == 3);
  assert(t.contains("Terminal"));
  assert(!t.contains("You VS Bot"));
  assert(app.selected_value() == "2");  // state survives the degraded frames

  HeadlessTerminal back(10, 30);
  assert(app.render(back) == FrameKind::Board);
  assert(back.contains("You VS Bot"));
}

static void run_input_failure_tests() {
  App app(make_config());
  HeadlessTerminal t(24, 80);
  t.push_key(key_char('s'));
  bool threw = false;
  try {
    app.run(t);
  } catch (const TerminalError&) {
    threw = true;
  }
  assert(threw);
  assert(app.selection().row() == 1);
  assert(t.frames() == 2);
}

int main() {
  run_scenario_tests();
  run_wasd_tests();
  run_quit_tests();
  run_ignored_event_tests();
  run_resize_tests();
  run_input_failure_tests();
  return 0;
}
