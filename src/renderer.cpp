#include "renderer.hpp"
#include "text_util.hpp"
#include <algorithm>

void Renderer::draw_span(ITerminal& term, int row, int col, const Span& s, bool color) const {
  if (s.text.empty()) return;
  if (s.style == Style::Selected && !color) {
    term.draw_highlighted(row, col, s.text, 0, static_cast<int>(s.text.size()));
    return;
  }
  int pair = color ? theme_.pair_for(s.style) : 0;
  if (pair > 0) term.draw_colored(row, col, s.text, pair);
  else term.draw_text(row, col, s.text);
}

int Renderer::draw_line(ITerminal& term, int row, const Line& line, int cols, bool color) const {
  int col = 0;
  for (const auto& span : line) {
    if (col >= cols) break;
    Span s{clip_to(span.text, cols - col), span.style};
    draw_span(term, row, col, s, color);
    col += display_width(s.text);
  }
  term.clear_to_eol(row, col);
  return col;
}

Line Renderer::header_line(const RenderSnapshot& snap, int cols) const {
  Line l;
  l.push_back({" kvview ", Style::Badge});
  std::string title = snap.view.empty() ? std::string() : snap.view.title();
  if (title.empty()) {
    l.push_back({" " + snap.path + " ", Style::Title});
  } else {
    l.push_back({" " + title + " ", Style::Title});
    if (snap.view_mode != ViewMode::Status && title != snap.path) l.push_back({" " + snap.path, Style::Dim});
  }
  std::string right;
  if (snap.view_mode == ViewMode::Table) {
    if (!snap.type_label.empty()) right = snap.type_label;
    if (!snap.rows.empty())
      right += "  " + std::to_string(snap.selected + 1) + "/" + std::to_string(snap.rows.size());
  } else if (!snap.view.empty()) {
    Position p = snap.view.position();
    right = view_mode_name(snap.view_mode);
    if (p.count > 0) right += "  " + std::to_string(p.selected) + "/" + std::to_string(p.count) + " " + p.label;
  }
  int used = display_width(line_text(l));
  int gap = cols - used - display_width(right) - 1;
  if (!right.empty() && gap > 0) {
    l.push_back({std::string(gap, ' '), Style::Normal});
    l.push_back({right, Style::Dim});
  }
  return l;
}

Line Renderer::status_line(const RenderSnapshot& snap, int cols) const {
  Line l;
  if (snap.mode == Mode::Expr && !snap.suggestions.empty()) {
    int used = 0;
    for (size_t i = 0; i < snap.suggestions.size(); ++i) {
      std::string label = suggestion_label(snap.suggestions[i]);
      int w = display_width(label) + 2;
      if (used + w > cols && used > 0) { l.push_back({" ...", Style::Dim}); break; }
      bool sel = static_cast<int>(i) == snap.suggestion_cursor;
      l.push_back({" " + label + " ", sel ? Style::Selected : Style::Accent});
      used += w;
    }
    return l;
  }
  if (snap.message_error && !snap.message.empty()) {
    l.push_back({" " + snap.message, Style::Error});
    return l;
  }
  if (!snap.view.empty()) {
    Flash f = snap.view.flash();
    if (!f.text.empty()) {
      l.push_back({" " + f.text, f.is_error ? Style::Error : Style::Success});
      return l;
    }
  }
  if (!snap.message.empty()) l.push_back({" " + snap.message, snap.message_error ? Style::Error : Style::Dim});
  return l;
}

void Renderer::draw_table(ITerminal& term, RenderSnapshot& snap, int top, int height, int cols) const {
  int key_w = 3;
  for (const auto& r : snap.rows) key_w = std::max(key_w, display_width(r.key));
  key_w = std::min(key_w, std::max(3, cols / 3));
  draw_line(term, top, Line{{pad_right("KEY", key_w) + "  VALUE", Style::Dim}}, cols, snap.color);
  int rows_h = height - 1;
  if (rows_h <= 0) return;
  if (snap.rows.empty()) {
    draw_line(term, top + 1, plain("(no rows)", Style::Dim), cols, snap.color);
    return;
  }
  Viewport local;
  Viewport& vp = snap.vp ? *snap.vp : local;
  if (snap.selected < vp.top_line) vp.top_line = snap.selected;
  if (snap.selected >= vp.top_line + rows_h) vp.top_line = snap.selected - rows_h + 1;
  if (vp.top_line < 0) vp.top_line = 0;
  for (int i = 0; i < rows_h; ++i) {
    int idx = vp.top_line + i;
    if (idx >= static_cast<int>(snap.rows.size())) break;
    const Row& r = snap.rows[idx];
    std::string key = pad_right(truncate_to(r.key, key_w), key_w);
    std::string val = truncate_to(r.value, std::max(3, cols - key_w - 2));
    if (idx == snap.selected) {
      std::string text = pad_right(key + "  " + val, cols);
      draw_span(term, top + 1 + i, 0, Span{clip_to(text, cols), Style::Selected}, snap.color);
    } else {
      draw_line(term, top + 1 + i, Line{{key, Style::Key}, {"  ", Style::Normal}, {val, Style::Normal}}, cols, snap.color);
    }
  }
}

void Renderer::draw_frame(ITerminal& term, const Frame& frame, int top, int height, int cols, bool color) const {
  for (int i = 0; i < height && i < static_cast<int>(frame.size()); ++i)
    draw_line(term, top + i, frame[i], cols, color);
}

void Renderer::render(ITerminal& term, RenderSnapshot& snap) {
  TermSize sz = term.getSize();
  int rows = sz.rows, cols = sz.cols;
  term.clear();
  if (rows <= 0 || cols <= 0) { term.refresh(); return; }

  draw_line(term, 0, header_line(snap, cols), cols, snap.color);
  int body_h = body_height(rows);

  if (snap.show_help) {
    Frame help;
    for (const auto& h : snap.help_lines) help.push_back(plain(h));
    draw_frame(term, help, 1, body_h, cols, snap.color);
  } else if (!snap.view.empty()) {
    draw_frame(term, snap.view.render(cols, body_h, snap.color), 1, body_h, cols, snap.color);
  } else {
    draw_table(term, snap, 1, body_h, cols);
  }

  if (rows >= 3) draw_line(term, rows - 2, status_line(snap, cols), cols, snap.color);

  int bottom = rows - 1;
  if (snap.mode == Mode::Expr || snap.mode == Mode::Search) {
    std::string prompt = snap.mode == Mode::Expr ? "> " : (snap.search_title.empty() ? "Search" : snap.search_title) + ": ";
    draw_line(term, bottom, Line{{prompt, Style::Accent}, {snap.input, Style::Normal}}, cols, snap.color);
    int cur = display_width(prompt) + display_width(snap.input.substr(0, std::min<size_t>(snap.input.size(), snap.input_cursor)));
    term.show_cursor(true);
    term.move_cursor(bottom, std::min(cur, cols - 1));
  } else {
    draw_line(term, bottom, plain(snap.footer, Style::Dim), cols, snap.color);
    term.show_cursor(false);
  }
  term.refresh();
}
