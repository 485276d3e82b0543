#pragma once
#include <string>
#include <vector>

enum class Style { Normal, Title, Dim, Badge, Selected, Success, Error, Accent, Key };

struct Span {
  std::string text;
  Style style = Style::Normal;
};

using Line = std::vector<Span>;
using Frame = std::vector<Line>;

std::string line_text(const Line& line);
std::string frame_text(const Frame& frame);
Line plain(const std::string& text, Style style = Style::Normal);

struct ThemeColor {
  Style style;
  short fg;
  short bg;
};

struct Theme {
  std::string name;
  std::vector<ThemeColor> colors;
  // ncurses pair id for a style; 0 draws with the default pair
  int pair_for(Style s) const;
};

Theme default_theme();
Theme monochrome_theme();
