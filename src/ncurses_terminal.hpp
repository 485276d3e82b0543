#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing and key input.
 * Note: initialization/teardown is managed by Terminal RAII wrapper.
 *       Color pairs are registered from the Theme handed to the constructor;
 *       ESC followed quickly by a key is reported as ALT_BIT | key.
 */
#include "iterminal.hpp"
#include "theme.hpp"
#include <ncurses.h>

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal(const Theme& theme, bool color);
  TermSize getSize() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void move_cursor(int row, int col) override;
  void show_cursor(bool visible) override;
  void refresh() override;
  void clear_to_eol(int row, int col) override;
  int read_key(int timeout_ms) override;
private:
  std::string fit(int row, int col, const std::string& text) const;
  bool color_ = false;
};
