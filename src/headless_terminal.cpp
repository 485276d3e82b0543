#include "headless_terminal.hpp"
#include <algorithm>

HeadlessTerminal::HeadlessTerminal(int rows, int cols) : rows_(rows), cols_(cols) {
  clear();
}

void HeadlessTerminal::clear() {
  grid_.assign(rows_, std::vector<std::string>(cols_, " "));
}

void HeadlessTerminal::resize(int rows, int cols) {
  rows_ = rows;
  cols_ = cols;
  clear();
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) {
  if (row < 0 || row >= rows_) return;
  size_t i = 0;
  while (i < text.size() && col < cols_) {
    unsigned char lead = (unsigned char)text[i];
    size_t n = lead < 0x80 ? 1 : (lead >> 5) == 0x6 ? 2 : (lead >> 4) == 0xE ? 3 : (lead >> 3) == 0x1E ? 4 : 1;
    if (col >= 0) grid_[row][col] = text.substr(i, n);
    i += n;
    col++;
  }
}

void HeadlessTerminal::draw_highlighted(int row, int col, const std::string& text, int, int) {
  draw_text(row, col, text);
}

void HeadlessTerminal::draw_colored(int row, int col, const std::string& text, int) {
  draw_text(row, col, text);
}

void HeadlessTerminal::clear_to_eol(int row, int col) {
  if (row < 0 || row >= rows_) return;
  for (int c = std::max(0, col); c < cols_; ++c) grid_[row][c] = " ";
}

int HeadlessTerminal::read_key(int) {
  if (keys_.empty()) return NO_KEY;
  int k = keys_.front();
  keys_.pop_front();
  return k;
}

void HeadlessTerminal::push_text(const std::string& s) {
  for (unsigned char c : s) keys_.push_back(c);
}

std::string HeadlessTerminal::row_text(int row) const {
  if (row < 0 || row >= rows_) return std::string();
  std::string out;
  for (const auto& cell : grid_[row]) out += cell;
  size_t end = out.find_last_not_of(' ');
  return end == std::string::npos ? std::string() : out.substr(0, end + 1);
}

std::string HeadlessTerminal::screen_text() const {
  std::string out;
  for (int r = 0; r < rows_; ++r) out += row_text(r) + "\n";
  return out;
}

bool HeadlessTerminal::contains(const std::string& needle) const {
  return screen_text().find(needle) != std::string::npos;
}
