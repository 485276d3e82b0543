#pragma once
/*
 * CustomView
 *
 * Purpose: tagged handle over the schema-driven views (list/detail/status)
 *          that replace the KEY/VALUE table for the current node.
 * Contract: title, footer, search hooks, flash, render, position, update.
 *           update returns the view to show next (possibly a different kind)
 *           and a Command for the host loop.
 * Note: active_custom_view is exhaustive over ViewMode; a mode whose state is
 *       missing resolves to an empty handle, never to another view's state.
 */
#include <memory>
#include <string>
#include "event.hpp"
#include "theme.hpp"

class ListView;
class DetailView;
class StatusView;

struct Position {
  int count = 0;
  int selected = 0; // 1-based
  std::string label;
};

struct Flash {
  std::string text;
  bool is_error = false;
};

struct ViewUpdate;

class CustomView {
public:
  enum class Kind { None, List, Detail, Status };

  CustomView() = default;
  explicit CustomView(std::shared_ptr<ListView> v);
  explicit CustomView(std::shared_ptr<DetailView> v);
  explicit CustomView(std::shared_ptr<StatusView> v);

  Kind kind() const { return kind_; }
  bool empty() const { return kind_ == Kind::None; }
  const std::shared_ptr<ListView>& list() const { return list_; }
  const std::shared_ptr<DetailView>& detail() const { return detail_; }
  const std::shared_ptr<StatusView>& status() const { return status_; }

  std::string title() const;
  std::string footer() const;
  bool handles_search() const;
  Command init();
  std::string search_title() const;
  Flash flash() const;
  Frame render(int width, int height, bool color);
  Position position() const;
  ViewUpdate update(const Event& e);

private:
  Kind kind_ = Kind::None;
  std::shared_ptr<ListView> list_;
  std::shared_ptr<DetailView> detail_;
  std::shared_ptr<StatusView> status_;
};

struct ViewUpdate {
  CustomView view;
  Command cmd;
};

enum class ViewMode { Table, List, Detail, Status };

struct ViewState {
  ViewMode mode = ViewMode::Table;
  std::shared_ptr<ListView> list;
  std::shared_ptr<DetailView> detail;
  std::shared_ptr<StatusView> status;

  void reset();
  void assign(const CustomView& v);
};

CustomView active_custom_view(const ViewState& state);
const char* view_mode_name(ViewMode m);
