#pragma once
/*
 * Renderer
 *
 * Purpose: draw header, body (KEY/VALUE table, custom view frame or help),
 *          status line and bottom bar (footer, expression or search bar).
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; receives a snapshot from App to render. The table
 *             viewport is the only thing adjusted (to keep selection visible).
 */
#include <string>
#include <vector>
#include "completion.hpp"
#include "custom_view.hpp"
#include "iterminal.hpp"
#include "theme.hpp"
#include "types.hpp"

struct RenderSnapshot {
  std::string path;
  std::string type_label;
  Mode mode = Mode::Browse;
  ViewMode view_mode = ViewMode::Table;

  // table
  std::vector<Row> rows;
  int selected = 0;
  Viewport* vp = nullptr;

  // custom view (empty in table mode)
  CustomView view;

  // bars
  std::string input;
  int input_cursor = 0;
  std::string search_title;
  std::vector<Suggestion> suggestions;
  int suggestion_cursor = -1;

  std::string message;
  bool message_error = false;
  std::string footer;

  bool show_help = false;
  std::vector<std::string> help_lines;
  bool color = true;
};

class Renderer {
public:
  explicit Renderer(Theme theme = default_theme()) : theme_(std::move(theme)) {}
  void render(ITerminal& term, RenderSnapshot& snap);
  const Theme& theme() const { return theme_; }

  // body rows left once header, status line and bottom bar are drawn
  static int body_height(int rows) { return rows > 3 ? rows - 3 : 1; }

private:
  void draw_span(ITerminal& term, int row, int col, const Span& s, bool color) const;
  int draw_line(ITerminal& term, int row, const Line& line, int cols, bool color) const;
  void draw_table(ITerminal& term, RenderSnapshot& snap, int top, int height, int cols) const;
  void draw_frame(ITerminal& term, const Frame& frame, int top, int height, int cols, bool color) const;
  Line header_line(const RenderSnapshot& snap, int cols) const;
  Line status_line(const RenderSnapshot& snap, int cols) const;

  Theme theme_;
};
