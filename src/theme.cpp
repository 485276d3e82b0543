#include "theme.hpp"
#include <ncurses.h>

std::string line_text(const Line& line) {
  std::string out;
  for (const auto& s : line) out += s.text;
  return out;
}

std::string frame_text(const Frame& frame) {
  std::string out;
  for (size_t i = 0; i < frame.size(); ++i) {
    if (i) out.push_back('\n');
    out += line_text(frame[i]);
  }
  return out;
}

Line plain(const std::string& text, Style style) {
  return Line{Span{text, style}};
}

int Theme::pair_for(Style s) const {
  for (size_t i = 0; i < colors.size(); ++i) {
    if (colors[i].style == s) return static_cast<int>(i) + 1;
  }
  return 0;
}

Theme default_theme() {
  Theme t;
  t.name = "default";
  t.colors = {
    {Style::Title, COLOR_CYAN, -1},
    {Style::Dim, COLOR_BLUE, -1},
    {Style::Badge, COLOR_BLACK, COLOR_CYAN},
    {Style::Success, COLOR_GREEN, -1},
    {Style::Error, COLOR_RED, -1},
    {Style::Accent, COLOR_YELLOW, -1},
    {Style::Key, COLOR_BLACK, COLOR_WHITE},
  };
  return t;
}

Theme monochrome_theme() {
  Theme t;
  t.name = "mono";
  return t;
}
