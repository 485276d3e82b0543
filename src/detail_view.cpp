#include "detail_view.hpp"
#include "list_view.hpp"
#include "data_tree.hpp"
#include "keybindings.hpp"
#include "path_address.hpp"
#include "text_util.hpp"
#include <algorithm>
#include <unordered_set>

using FieldSet = std::unordered_set<std::string>;

static std::string value_for_table(const YAML::Node& v, int max_width) {
  max_width = std::max(3, max_width);
  return truncate_to(stringify(v), max_width);
}

static std::vector<Line> inline_section(const YAML::Node& obj, const std::vector<std::string>& fields,
                                        int width, const FieldSet& hidden, bool color) {
  std::string joined;
  for (const auto& f : fields) {
    if (hidden.count(f)) continue;
    std::string s = field_text(obj, f);
    if (s.empty()) continue;
    joined += (joined.empty() ? "" : " · ") + s;
  }
  if (joined.empty()) return {};
  return {plain(truncate_to(joined, width), color ? Style::Accent : Style::Normal)};
}

static std::vector<Line> paragraph_section(const YAML::Node& obj, const std::vector<std::string>& fields,
                                           int width, const FieldSet& hidden) {
  std::vector<Line> lines;
  for (const auto& f : fields) {
    if (hidden.count(f)) continue;
    std::string s = field_text(obj, f);
    if (s.empty()) continue;
    for (const auto& l : wrap_words(s, width)) lines.push_back(plain(l));
  }
  return lines;
}

static std::vector<Line> tags_section(const YAML::Node& obj, const std::vector<std::string>& fields,
                                      int width, const FieldSet& hidden, bool color) {
  std::vector<std::string> tags;
  for (const auto& f : fields) {
    if (hidden.count(f)) continue;
    YAML::Node v;
    if (!field_value(obj, f, v) || v.IsNull()) continue;
    if (v.IsSequence()) {
      for (const auto& t : v) tags.push_back(scalar_text(t));
    } else {
      tags.push_back(scalar_text(v));
    }
  }
  std::vector<Line> lines;
  Line cur;
  int cur_w = 0;
  for (const auto& t : tags) {
    std::string pill = " " + t + " ";
    int w = display_width(pill);
    int need = cur_w > 0 ? w + 1 : w;
    if (cur_w > 0 && cur_w + need > width) {
      lines.push_back(std::move(cur));
      cur.clear();
      cur_w = 0;
      need = w;
    }
    if (cur_w > 0) cur.push_back(Span{" ", Style::Normal});
    cur.push_back(Span{pill, color ? Style::Badge : Style::Normal});
    cur_w += need;
  }
  if (!cur.empty()) lines.push_back(std::move(cur));
  return lines;
}

static std::vector<Line> table_section(const YAML::Node& obj, const std::vector<std::string>& fields,
                                       int width, const FieldSet& hidden, bool color) {
  int key_w = 0;
  for (const auto& f : fields) if (!hidden.count(f)) key_w = std::max(key_w, display_width(f));
  key_w = std::min(key_w, std::max(1, width / 3));
  std::vector<Line> lines;
  for (const auto& f : fields) {
    if (hidden.count(f)) continue;
    YAML::Node v;
    if (!field_value(obj, f, v)) continue;
    std::string key = display_width(f) > key_w ? truncate_to(f, key_w) : f;
    Line l;
    l.push_back(Span{pad_right(key, key_w), color ? Style::Title : Style::Normal});
    l.push_back(Span{"  ", Style::Normal});
    l.push_back(Span{value_for_table(v, width - key_w - 3), Style::Normal});
    lines.push_back(std::move(l));
  }
  return lines;
}

DetailView::DetailView(const YAML::Node& obj, const DisplaySchema& schema, std::string path, KeyMode mode,
                       std::shared_ptr<ListView> origin)
  : path_(std::move(path)), mode_(mode), origin_(std::move(origin)) {
  obj_.reset(obj);
  if (schema.detail) cfg_ = *schema.detail;
}

std::string DetailView::title() const {
  std::string t = field_text(obj_, cfg_.title_field);
  if (!t.empty()) return t;
  auto segs = split_segments(path_);
  return segs.empty() ? std::string("_") : segs.back();
}

std::string DetailView::footer() const {
  return display_key(binding_for(Action::Up, mode_), mode_) + "/" + display_key(binding_for(Action::Down, mode_), mode_) +
         " scroll  " + display_key(binding_for(Action::Back, mode_), mode_) + " back  " + quit_key(mode_) + " quit";
}

Frame DetailView::content(int width, bool color) const {
  Frame out;
  if (!obj_.IsMap()) { out.push_back(plain("  (no data)")); return out; }
  FieldSet hidden(cfg_.hidden_fields.begin(), cfg_.hidden_fields.end());
  if (!cfg_.title_field.empty()) hidden.insert(cfg_.title_field);
  FieldSet covered;
  for (const auto& s : cfg_.sections) covered.insert(s.fields.begin(), s.fields.end());

  auto emit = [&](const std::string& title, std::vector<Line> lines) {
    if (lines.empty()) return;
    out.push_back(Line{});
    if (!title.empty()) out.push_back(plain(title, color ? Style::Accent : Style::Normal));
    for (auto& l : lines) out.push_back(std::move(l));
  };

  for (const auto& s : cfg_.sections) {
    switch (s.layout) {
      case SectionLayout::Inline: emit(s.title, inline_section(obj_, s.fields, width, hidden, color)); break;
      case SectionLayout::Paragraph: emit(s.title, paragraph_section(obj_, s.fields, width, hidden)); break;
      case SectionLayout::Tags: emit(s.title, tags_section(obj_, s.fields, width, hidden, color)); break;
      case SectionLayout::Table: emit(s.title, table_section(obj_, s.fields, width, hidden, color)); break;
    }
  }

  std::vector<std::string> rest;
  for (const auto& k : child_keys(obj_)) if (!covered.count(k) && !hidden.count(k)) rest.push_back(k);
  emit(std::string(), table_section(obj_, rest, width, hidden, color));
  return out;
}

Frame DetailView::render(int width, int height, bool color) {
  Frame all = content(std::max(10, width - 4), color);
  last_total_ = static_cast<int>(all.size());
  last_height_ = std::max(1, height);
  if (scroll_top_ > last_total_ - last_height_) scroll_top_ = last_total_ - last_height_;
  if (scroll_top_ < 0) scroll_top_ = 0;
  int end = std::min(last_total_, scroll_top_ + last_height_);
  return Frame(all.begin() + scroll_top_, all.begin() + end);
}

Position DetailView::position() const {
  return Position{std::max(1, last_total_), scroll_top_ + 1, "lines"};
}

ViewUpdate DetailView::update(const Event& e) {
  CustomView self(shared_from_this());
  if (e.type != Event::Type::Key) return ViewUpdate{self, Command::none()};
  int max_top = std::max(0, last_total_ - last_height_);
  switch (resolve_action(e.key, mode_)) {
    case Action::Up: scroll_top_ = std::max(0, scroll_top_ - 1); break;
    case Action::Down: scroll_top_ = std::min(max_top, scroll_top_ + 1); break;
    case Action::Top: scroll_top_ = 0; break;
    case Action::Bottom: scroll_top_ = max_top; break;
    case Action::Back:
      if (origin_) return ViewUpdate{CustomView(origin_), Command::navigate(origin_->path())};
      return ViewUpdate{CustomView(), Command::back()};
    case Action::Quit:
      return ViewUpdate{self, Command::quit()};
    default:
      if (e.key == ESC) {
        if (origin_) return ViewUpdate{CustomView(origin_), Command::navigate(origin_->path())};
        return ViewUpdate{CustomView(), Command::back()};
      }
      break;
  }
  return ViewUpdate{self, Command::none()};
}
