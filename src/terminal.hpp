#pragma once
/*
 * Terminal
 *
 * Purpose: RAII wrapper around ncurses init/teardown.
 * Usage: construct in main before NcursesTerminal; destructor restores the
 *        terminal so the final path can be printed to stdout afterwards.
 * Note: manages terminal modes (raw/noecho/keypad), not rendering.
 */
#include <ncurses.h>

class Terminal {
public:
  Terminal();
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;
};
