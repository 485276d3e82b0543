#include "custom_view.hpp"
#include "list_view.hpp"
#include "detail_view.hpp"
#include "status_view.hpp"

CustomView::CustomView(std::shared_ptr<ListView> v)
  : kind_(v ? Kind::List : Kind::None), list_(std::move(v)) {}

CustomView::CustomView(std::shared_ptr<DetailView> v)
  : kind_(v ? Kind::Detail : Kind::None), detail_(std::move(v)) {}

CustomView::CustomView(std::shared_ptr<StatusView> v)
  : kind_(v ? Kind::Status : Kind::None), status_(std::move(v)) {}

std::string CustomView::title() const {
  switch (kind_) {
    case Kind::List: return list_->title();
    case Kind::Detail: return detail_->title();
    case Kind::Status: return status_->title();
    case Kind::None: break;
  }
  return std::string();
}

std::string CustomView::footer() const {
  switch (kind_) {
    case Kind::List: return list_->footer();
    case Kind::Detail: return detail_->footer();
    case Kind::Status: return status_->footer();
    case Kind::None: break;
  }
  return std::string();
}

bool CustomView::handles_search() const {
  return kind_ == Kind::List && list_->handles_search();
}

Command CustomView::init() {
  if (kind_ == Kind::Status) return status_->init();
  return Command::none();
}

std::string CustomView::search_title() const {
  if (kind_ == Kind::List) return list_->search_title();
  return std::string();
}

Flash CustomView::flash() const {
  if (kind_ == Kind::Status) return status_->flash();
  return Flash{};
}

Frame CustomView::render(int width, int height, bool color) {
  switch (kind_) {
    case Kind::List: return list_->render(width, height, color);
    case Kind::Detail: return detail_->render(width, height, color);
    case Kind::Status: return status_->render(width, height, color);
    case Kind::None: break;
  }
  return Frame{};
}

Position CustomView::position() const {
  switch (kind_) {
    case Kind::List: return list_->position();
    case Kind::Detail: return detail_->position();
    case Kind::Status: return status_->position();
    case Kind::None: break;
  }
  return Position{};
}

ViewUpdate CustomView::update(const Event& e) {
  switch (kind_) {
    case Kind::List: return list_->update(e);
    case Kind::Detail: return detail_->update(e);
    case Kind::Status: return ViewUpdate{*this, status_->update(e)};
    case Kind::None: break;
  }
  return ViewUpdate{*this, Command::none()};
}

void ViewState::reset() {
  mode = ViewMode::Table;
  list.reset();
  detail.reset();
  status.reset();
}

void ViewState::assign(const CustomView& v) {
  reset();
  switch (v.kind()) {
    case CustomView::Kind::List: mode = ViewMode::List; list = v.list(); break;
    case CustomView::Kind::Detail: mode = ViewMode::Detail; detail = v.detail(); break;
    case CustomView::Kind::Status: mode = ViewMode::Status; status = v.status(); break;
    case CustomView::Kind::None: break;
  }
}

CustomView active_custom_view(const ViewState& state) {
  switch (state.mode) {
    case ViewMode::List: return CustomView(state.list);
    case ViewMode::Detail: return CustomView(state.detail);
    case ViewMode::Status: return CustomView(state.status);
    case ViewMode::Table: break;
  }
  return CustomView();
}

const char* view_mode_name(ViewMode m) {
  switch (m) {
    case ViewMode::List: return "list";
    case ViewMode::Detail: return "detail";
    case ViewMode::Status: return "status";
    case ViewMode::Table: break;
  }
  return "table";
}
