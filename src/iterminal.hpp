#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, draw, cursor, refresh, key input).
 * Goal: decouple App/Renderer from ncurses so headless tests can drive them.
 * Note: read_key returns NO_KEY when timeout_ms elapses without input.
 */
#include <string>

struct TermSize { int rows; int cols; };

static constexpr int NO_KEY = -1;

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize getSize() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) = 0;
  virtual void draw_colored(int row, int col, const std::string& text, int color_pair_id) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void show_cursor(bool visible) = 0;
  virtual void refresh() = 0;
  virtual void clear_to_eol(int row, int col) = 0;
  virtual int read_key(int timeout_ms) = 0;
};
