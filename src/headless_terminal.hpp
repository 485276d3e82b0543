#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for tests; records drawn text in a row grid
 *          and replays queued keys.
 * Note: read_key never blocks; it returns NO_KEY once the queue is drained.
 */
#include "iterminal.hpp"
#include <deque>
#include <string>
#include <vector>

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);
  TermSize getSize() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void move_cursor(int row, int col) override { cursor_row_ = row; cursor_col_ = col; }
  void show_cursor(bool visible) override { cursor_visible_ = visible; }
  void refresh() override { refreshes_++; }
  void clear_to_eol(int row, int col) override;
  int read_key(int timeout_ms) override;

  void push_key(int key) { keys_.push_back(key); }
  void push_text(const std::string& s);
  void resize(int rows, int cols);

  std::string row_text(int row) const;
  std::string screen_text() const;
  bool contains(const std::string& needle) const;
  int cursor_row() const { return cursor_row_; }
  int cursor_col() const { return cursor_col_; }
  int refreshes() const { return refreshes_; }
  size_t pending_keys() const { return keys_.size(); }

private:
  int rows_;
  int cols_;
  // each cell holds one UTF-8 code point
  std::vector<std::vector<std::string>> grid_;
  std::deque<int> keys_;
  int cursor_row_ = 0;
  int cursor_col_ = 0;
  bool cursor_visible_ = true;
  int refreshes_ = 0;
};
