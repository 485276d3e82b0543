#include "terminal.hpp"
#include "config.hpp"
#include <locale.h>

Terminal::Terminal() {
  setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  keypad(stdscr, TRUE);
  // ESC+key inside this window reads as Alt
  set_escdelay(KVVIEW_ESC_DELAY_MS);
  // cursor is shown only in the expression and search bars
  curs_set(0);
}

Terminal::~Terminal() {
  curs_set(1);
  endwin();
}
