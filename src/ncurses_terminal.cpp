#include "ncurses_terminal.hpp"
#include "keybindings.hpp"
#include "text_util.hpp"
#include <algorithm>

NcursesTerminal::NcursesTerminal(const Theme& theme, bool color) {
  color_ = color && has_colors();
  if (!color_) return;
  start_color();
  bool default_bg = use_default_colors() == OK;
  for (size_t i = 0; i < theme.colors.size(); ++i) {
    const ThemeColor& c = theme.colors[i];
    short bg = c.bg;
    if (bg < 0 && !default_bg) bg = COLOR_BLACK; // fallback
    init_pair(static_cast<short>(i + 1), c.fg, bg);
  }
}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

std::string NcursesTerminal::fit(int row, int col, const std::string& text) const {
  TermSize sz = getSize();
  if (row < 0 || row >= sz.rows || col >= sz.cols) return std::string();
  return clip_to(text, sz.cols - col);
}

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  std::string s = fit(row, col, text);
  if (s.empty()) return;
  mvaddnstr(row, col, s.c_str(), (int)s.size());
}

void NcursesTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  int len = (int)text.size();
  hl_start = std::clamp(hl_start, 0, len);
  int hl_end = std::clamp(hl_start + std::max(0, hl_len), hl_start, len);
  if (len == 0) {
    int rem = std::max(0, getSize().cols - col);
    attron(A_REVERSE);
    draw_text(row, col, std::string(rem, ' '));
    attroff(A_REVERSE);
    return;
  }
  std::string left = text.substr(0, hl_start);
  std::string mid = text.substr(hl_start, hl_end - hl_start);
  std::string right = text.substr(hl_end);
  draw_text(row, col, left);
  col += display_width(left);
  attron(A_REVERSE);
  draw_text(row, col, mid);
  attroff(A_REVERSE);
  col += display_width(mid);
  draw_text(row, col, right);
}

void NcursesTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  if (!color_ || color_pair_id <= 0) { draw_text(row, col, text); return; }
  attron(COLOR_PAIR(color_pair_id));
  draw_text(row, col, text);
  attroff(COLOR_PAIR(color_pair_id));
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::show_cursor(bool visible) { curs_set(visible ? 1 : 0); }

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}

int NcursesTerminal::read_key(int timeout_ms) {
  timeout(timeout_ms);
  int ch = getch();
  if (ch == ERR) return NO_KEY;
  if (ch != ESC) return ch;
  timeout(0);
  int next = getch();
  if (next == ERR || next == ESC) return ESC;
  return ALT_BIT | next;
}
