#include "list_view.hpp"
#include "detail_view.hpp"
#include "data_tree.hpp"
#include "keybindings.hpp"
#include "path_address.hpp"
#include "text_util.hpp"
#include <algorithm>

bool is_object_array(const YAML::Node& n) {
  if (!n.IsSequence() || n.size() == 0) return false;
  for (const auto& item : n) if (!item.IsMap()) return false;
  return true;
}

ListView::ListView(const YAML::Node& items, const DisplaySchema& schema, std::string path, KeyMode mode)
  : schema_(schema), path_(std::move(path)), mode_(mode) {
  node_.reset(items);
  if (!schema_.list || !items.IsSequence()) return;
  const ListDisplay& cfg = *schema_.list;
  int i = 0;
  for (const auto& obj : items) {
    int idx = i++;
    if (!obj.IsMap()) continue;
    ListItem item;
    item.index = idx;
    item.title = field_text(obj, cfg.title_field);
    item.subtitle = field_text(obj, cfg.subtitle_field);
    for (const auto& bf : cfg.badge_fields) {
      YAML::Node v;
      if (!field_value(obj, bf, v) || v.IsNull()) continue;
      if (v.IsSequence()) {
        for (const auto& b : v) item.badges.push_back(scalar_text(b));
      } else {
        item.badges.push_back(scalar_text(v));
      }
    }
    for (const auto& sf : cfg.secondary_fields) {
      YAML::Node v;
      if (field_value(obj, sf, v) && !v.IsNull()) item.secondary.push_back(scalar_text(v));
    }
    items_.push_back(std::move(item));
  }
}

std::string ListView::title() const {
  if (!schema_.collection_title.empty()) return schema_.collection_title;
  return display_form(path_);
}

std::string ListView::footer() const {
  std::string up = display_key(binding_for(Action::Up, mode_), mode_);
  std::string down = display_key(binding_for(Action::Down, mode_), mode_);
  return up + "/" + down + " move  " + display_key(binding_for(Action::Forward, mode_), mode_) + " open  " +
         display_key(binding_for(Action::Search, mode_), mode_) + " filter  " + quit_key(mode_) + " quit";
}

std::vector<int> ListView::visible() const {
  std::vector<int> out;
  for (size_t i = 0; i < items_.size(); ++i) {
    const ListItem& it = items_[i];
    if (!filter_.empty() && !contains_ci(it.title, filter_) && !contains_ci(it.subtitle, filter_)) continue;
    out.push_back(static_cast<int>(i));
  }
  return out;
}

void ListView::set_filter(const std::string& q) {
  filter_ = q;
  selected_ = 0;
  scroll_top_ = 0;
}

Position ListView::position() const {
  int n = static_cast<int>(visible().size());
  return Position{n, n == 0 ? 0 : selected_ + 1, "items"};
}

Frame ListView::render(int width, int height, bool color) {
  Frame out;
  if (items_.empty()) { out.push_back(plain("  (empty)")); return out; }
  std::vector<int> vis = visible();
  if (vis.empty()) { out.push_back(plain("  (no matches)")); return out; }

  int content_width = std::max(10, width - 4);
  int sub_lines = schema_.list ? std::max(1, schema_.list->subtitle_max_lines) : 1;
  bool has_secondary = schema_.list && !schema_.list->secondary_fields.empty();
  int per_item = std::max(2, 1 + sub_lines + (has_secondary ? 1 : 0)) + 1;

  int header_lines = 0;
  if (!schema_.icon.empty() || !schema_.collection_title.empty()) {
    std::string header = schema_.icon.empty() ? schema_.collection_title : trim(schema_.icon + " " + schema_.collection_title);
    out.push_back(Line{Span{"  ", Style::Normal}, Span{header, color ? Style::Title : Style::Normal}});
    out.push_back(plain("  " + std::to_string(vis.size()) + " items", color ? Style::Dim : Style::Normal));
    out.push_back(Line{});
    header_lines = 3;
  }

  int available = std::max(per_item, height - header_lines);
  int count = std::max(1, available / per_item);
  if (selected_ >= (int)vis.size()) selected_ = (int)vis.size() - 1;
  if (selected_ < scroll_top_) scroll_top_ = selected_;
  if (selected_ >= scroll_top_ + count) scroll_top_ = selected_ - count + 1;
  if (scroll_top_ < 0) scroll_top_ = 0;

  int end = std::min((int)vis.size(), scroll_top_ + count);
  for (int i = scroll_top_; i < end; ++i) {
    const ListItem& it = items_[vis[i]];
    bool sel = i == selected_;
    Line title_line;
    title_line.push_back(Span{sel ? "│ " : "  ", sel && color ? Style::Accent : Style::Normal});
    std::string title = it.title.empty() ? "[" + std::to_string(it.index) + "]" : it.title;
    title_line.push_back(Span{truncate_to(title, content_width), color ? Style::Title : Style::Normal});
    int used = 2 + display_width(title);
    for (const auto& b : it.badges) {
      std::string pill = " " + b + " ";
      if (used + 1 + display_width(pill) > content_width + 2) break;
      title_line.push_back(Span{" ", Style::Normal});
      title_line.push_back(Span{pill, color ? Style::Badge : Style::Normal});
      used += 1 + display_width(pill);
    }
    out.push_back(std::move(title_line));

    if (!it.subtitle.empty()) {
      int max_sub = std::max(5, content_width - 2);
      auto wrapped = wrap_words(it.subtitle, max_sub);
      if ((int)wrapped.size() > sub_lines) {
        wrapped.resize(sub_lines);
        std::string& last = wrapped.back();
        if (display_width(last) > max_sub - 3) last = truncate_to(last, max_sub - 3) + "...";
        else last += "...";
      }
      for (const auto& sl : wrapped) out.push_back(plain("  " + sl, color ? Style::Dim : Style::Normal));
    }

    if (!it.secondary.empty()) {
      std::string joined;
      for (size_t k = 0; k < it.secondary.size(); ++k) joined += (k ? " · " : "") + it.secondary[k];
      out.push_back(plain("    " + truncate_to(joined, content_width - 2), color ? Style::Dim : Style::Normal));
    }
    if (i < end - 1) out.push_back(Line{});
  }
  return out;
}

ViewUpdate ListView::drill_in() {
  std::vector<int> vis = visible();
  if (vis.empty() || selected_ >= (int)vis.size()) return ViewUpdate{CustomView(shared_from_this()), Command::none()};
  int idx = items_[vis[selected_]].index;
  std::string child = build_child_path(display_form(path_), "[" + std::to_string(idx) + "]");
  if (!schema_.detail) return ViewUpdate{CustomView(), Command::navigate(child)};
  const YAML::Node& arr = node_;
  auto dv = std::make_shared<DetailView>(arr[static_cast<size_t>(idx)], schema_, child, mode_, shared_from_this());
  return ViewUpdate{CustomView(dv), Command::navigate(child)};
}

ViewUpdate ListView::update(const Event& e) {
  CustomView self(shared_from_this());
  if (e.type != Event::Type::Key) return ViewUpdate{self, Command::none()};
  int n = static_cast<int>(visible().size());
  switch (resolve_action(e.key, mode_)) {
    case Action::Up: if (selected_ > 0) selected_--; break;
    case Action::Down: if (selected_ < n - 1) selected_++; break;
    case Action::Top: selected_ = 0; scroll_top_ = 0; break;
    case Action::Bottom: selected_ = std::max(0, n - 1); break;
    case Action::Forward:
    case Action::Enter:
      return drill_in();
    case Action::Back:
      if (!filter_.empty()) { set_filter(std::string()); break; }
      return ViewUpdate{CustomView(), Command::back()};
    case Action::Quit:
      return ViewUpdate{self, Command::quit()};
    default:
      if (e.key == ESC && !filter_.empty()) set_filter(std::string());
      break;
  }
  return ViewUpdate{self, Command::none()};
}
