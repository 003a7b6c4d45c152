#include "ncurses_terminal.hpp"
#include <algorithm>
#include <cstdlib>

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    colors_ = start_color() == OK;
    caps_.default_colors = colors_ && use_default_colors() == OK;
    caps_.colors = COLORS;
    caps_.direct = tigetflag("RGB") > 0;
  }
}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

static const int kCubeLevels[6] = {0, 95, 135, 175, 215, 255};

static int nearest_cube(int v) {
  int best = 0;
  for (int i = 1; i < 6; ++i)
    if (std::abs(kCubeLevels[i] - v) < std::abs(kCubeLevels[best] - v)) best = i;
  return best;
}

static int dist2(int r0, int g0, int b0, int r1, int g1, int b1) {
  return (r0 - r1) * (r0 - r1) + (g0 - g1) * (g0 - g1) + (b0 - b1) * (b0 - b1);
}

// xterm-256: 6x6x6 cube at 16..231, 24 grays (8, 18, .. 238) at 232..255
static int xterm256(const Color& c) {
  int ri = nearest_cube(c.r), gi = nearest_cube(c.g), bi = nearest_cube(c.b);
  int cube_d = dist2(c.r, c.g, c.b, kCubeLevels[ri], kCubeLevels[gi], kCubeLevels[bi]);
  int gray = 0, gray_d = -1;
  for (int i = 0; i < 24; ++i) {
    int lv = 8 + 10 * i;
    int d = dist2(c.r, c.g, c.b, lv, lv, lv);
    if (gray_d < 0 || d < gray_d) { gray = i; gray_d = d; }
  }
  if (gray_d < cube_d) return 232 + gray;
  return 16 + 36 * ri + 6 * gi + bi;
}

int curses_color(const std::optional<Color>& c, bool foreground, const ColorCaps& caps) {
  if (!c || c->kind == Color::Kind::Reset) {
    if (caps.default_colors) return -1;
    return foreground ? COLOR_WHITE : COLOR_BLACK;
  }
  if (c->kind == Color::Kind::Named) return static_cast<int>(c->named);
  if (caps.direct) return (c->r << 16) | (c->g << 8) | c->b;
  if (caps.colors >= 256) return xterm256(*c);
  // 8-color terminals: one bit per channel, ANSI order (red=1, green=2, blue=4)
  return (c->r > 127 ? 1 : 0) | (c->g > 127 ? 2 : 0) | (c->b > 127 ? 4 : 0);
}

int NcursesTerminal::pair_for(int fg, int bg) {
  auto key = std::make_pair(fg, bg);
  if (auto it = pairs_.find(key); it != pairs_.end()) return it->second;
  if (next_pair_ >= std::min(COLOR_PAIRS, 256)) return 0;  // COLOR_PAIR() only encodes 256 pairs
  int id = next_pair_++;
  if (init_extended_pair(id, fg, bg) == ERR) return 0;
  pairs_[key] = id;
  return id;
}

attr_t NcursesTerminal::attrs_for(const Style& style) {
  attr_t a = A_NORMAL;
  if (colors_) a |= COLOR_PAIR(pair_for(curses_color(style.fg, true, caps_), curses_color(style.bg, false, caps_)));
  if (style.has(Modifier::Reversed)) a |= A_REVERSE;
  if (style.has(Modifier::Bold)) a |= A_BOLD;
  return a;
}

void NcursesTerminal::fill(const Rect& area, const Style& style) {
  TermSize sz = getSize();
  int c0 = std::max(0, area.col);
  int c1 = std::min(sz.cols, area.col + area.width);
  if (c1 <= c0) return;
  chtype blank = ' ' | attrs_for(style);
  for (int r = std::max(0, area.row); r < std::min(sz.rows, area.row + area.height); ++r)
    mvhline(r, c0, blank, c1 - c0);
}

void NcursesTerminal::draw_text(int row, int col, const std::string& text, const Style& style) {
  TermSize sz = getSize();
  if (row < 0 || row >= sz.rows || col >= sz.cols) return;
  int skip = std::max(0, -col);
  int n = std::min(static_cast<int>(text.size()) - skip, sz.cols - std::max(0, col));
  if (n <= 0) return;
  attr_t a = attrs_for(style);
  attron(a);
  mvaddnstr(row, std::max(0, col), text.c_str() + skip, n);
  attroff(a);
}

void NcursesTerminal::refresh() { ::refresh(); }

InputEvent NcursesTerminal::read_event() {
  int ch = getch();
  if (ch == ERR) throw TerminalError("can not read input from terminal");
  if (ch == KEY_RESIZE) return InputEvent{InputEvent::Type::Resize, KeyEvent{}};
  if (ch == KEY_MOUSE) return InputEvent{InputEvent::Type::Other, KeyEvent{}};
  return key_event(decode_key(ch));
}

KeyEvent decode_key(int ch) {
  switch (ch) {
    case KEY_UP: return key_code(KeyCode::Up);
    case KEY_DOWN: return key_code(KeyCode::Down);
    case KEY_LEFT: return key_code(KeyCode::Left);
    case KEY_RIGHT: return key_code(KeyCode::Right);
    case 27: return key_code(KeyCode::Esc);
    case KEY_ENTER: case '\n': case '\r': return key_code(KeyCode::Enter);
    case KEY_BACKSPACE: case 127: case 8: return key_code(KeyCode::Backspace);
    default: break;
  }
  if (ch >= 1 && ch <= 26) return key_char(static_cast<char>('a' + ch - 1), KeyMod::Ctrl);
  if (ch >= 32 && ch < 127) return key_char(static_cast<char>(ch));
  return key_code(KeyCode::Other);
}
