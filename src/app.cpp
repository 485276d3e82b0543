#include "app.hpp"
#include "config.hpp"
#include "detail_view.hpp"
#include "file_reader.hpp"
#include "keybindings.hpp"
#include "list_view.hpp"
#include "path_address.hpp"
#include "status_view.hpp"
#include "text_util.hpp"
#include <ncurses.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>

App::App(ITerminal& term, const YAML::Node& root, DisplaySchema schema, FunctionCatalog catalog, Effects& effects)
  : term_(term),
    schema_(std::move(schema)),
    catalog_(std::move(catalog)),
    completion_(&catalog_),
    effects_(effects),
    key_mode_(KVVIEW_DEFAULT_KEYMODE),
    flash_ms_(KVVIEW_FLASH_MS) {
  root_.reset(root);
  node_.reset(root_);
  register_commands();
}

void App::set_key_mode(KeyMode m) {
  key_mode_ = m;
  input_seq_.reset();
  if (started_ && views_.mode != ViewMode::Status) resolve_view();
}

void App::set_message(std::string msg, bool error) {
  if (error) spdlog::debug("error: {}", msg);
  message_ = std::move(msg);
  message_error_ = error;
}

bool App::execute_command_line(const std::string& line) {
  std::string msg;
  if (!registry_.execute_line(line, msg)) {
    set_message(msg, true);
    return false;
  }
  return true;
}

bool App::load_rc(const std::filesystem::path& path, std::string& msg) {
  std::vector<std::string> lines;
  if (!read_lines(path, lines, msg)) return false;
  int failed = 0;
  for (const auto& cmd : rc_command_lines(lines)) {
    if (!execute_command_line(cmd)) failed++;
  }
  spdlog::debug("rc {}: {} failed command(s)", path.string(), failed);
  if (failed > 0) { msg = message_; return false; }
  return true;
}

void App::load_default_rc() {
  const char* home = std::getenv("HOME");
  if (!home) return;
  std::error_code ec;
  auto p = std::filesystem::path(home) / KVVIEW_RC_NAME;
  if (!std::filesystem::exists(p, ec)) return;
  std::string msg;
  if (!load_rc(p, msg)) set_message(msg, true);
}

void App::start() {
  if (started_) return;
  started_ = true;
  resolve_view();
}

void App::run() {
  while (step()) {}
}

bool App::step() {
  if (!started_) start();
  if (should_quit_) return false;
  render();
  int ch = term_.read_key(loop_.next_timeout_ms(KVVIEW_IDLE_POLL_MS));
  handle_key(ch);
  if (!should_quit_) process_events();
  return !should_quit_;
}

void App::process_events(EventLoop::Clock::time_point now) {
  if (views_.mode == ViewMode::Status && views_.status) {
    Event done;
    if (views_.status->poll(done)) loop_.post(std::move(done));
  }
  Event e;
  while (!should_quit_ && loop_.pop(e, now)) dispatch(e);
}

void App::dispatch(const Event& e) {
  if (e.type == Event::Type::Key) { handle_key(e.key); return; }
  CustomView v = active_custom_view(views_);
  // timers outliving their view are dropped
  if (v.empty()) return;
  apply(v.update(e));
}

void App::set_location(const std::string& path, const YAML::Node& n) {
  remembered_[path_] = selected_;
  path_ = path;
  node_.reset(n);
  auto it = remembered_.find(path_);
  selected_ = it == remembered_.end() ? 0 : it->second;
  vp_ = Viewport{};
  query_.clear();
  show_help_ = false;
  int count = static_cast<int>(node_rows(node_).size());
  if (selected_ >= count) selected_ = std::max(0, count - 1);
}

void App::resolve_view() {
  ViewMode prev = views_.mode;
  if (schema_.status && !schema_.status->title_field.empty()) {
    if (views_.mode == ViewMode::Status && views_.status) return;
    auto sv = std::make_shared<StatusView>(node_, *schema_.status, key_mode_, channel_);
    sv->set_flash_duration(std::chrono::milliseconds(flash_ms_));
    CustomView v(sv);
    views_.assign(v);
    spdlog::debug("status view started for {} (channel: {})", path_, channel_ ? "yes" : "no");
    execute(v.init());
    return;
  }
  if (schema_.list && !schema_.list->title_field.empty() && is_object_array(node_)) {
    views_.assign(CustomView(std::make_shared<ListView>(node_, schema_, path_, key_mode_)));
  } else if (schema_.detail && node_.IsMap() && (prev == ViewMode::List || prev == ViewMode::Detail)) {
    views_.assign(CustomView(std::make_shared<DetailView>(node_, schema_, path_, key_mode_)));
  } else {
    views_.reset();
  }
  spdlog::debug("view for {}: {}", path_, view_mode_name(views_.mode));
}

void App::apply(ViewUpdate u) {
  views_.assign(u.view);
  execute(u.cmd);
}

// the status screen shows its own flash; other modes use the status line
void App::effect_failed(const std::string& msg) {
  if (views_.mode == ViewMode::Status && views_.status) {
    execute(views_.status->effect_failed(msg));
    return;
  }
  set_message(msg, true);
}

void App::execute(const Command& c) {
  std::string msg;
  switch (c.type) {
    case Command::Type::None:
      break;
    case Command::Type::Quit:
      should_quit_ = true;
      break;
    case Command::Type::Schedule:
      loop_.schedule(c.delay, c.event);
      break;
    case Command::Type::CopyToClipboard:
      if (!effects_.copy_to_clipboard(c.payload, msg)) {
        spdlog::warn("copy failed: {}", msg);
        effect_failed(msg);
      }
      break;
    case Command::Type::OpenUrl:
      if (!effects_.open_url(c.payload, msg)) {
        spdlog::warn("open {} failed: {}", c.payload, msg);
        effect_failed(msg);
      }
      break;
    case Command::Type::Navigate: {
      YAML::Node n;
      if (!node_at_path(root_, normalized_form(c.payload), n, msg)) {
        set_message(msg, true);
        views_.reset();
        break;
      }
      bool keep = views_.mode != ViewMode::Table;
      expr_origin_.reset();
      set_location(display_form(c.payload), n);
      if (!keep) resolve_view();
      break;
    }
    case Command::Type::Back:
      go_back();
      break;
    case Command::Type::Batch:
      for (const auto& b : c.batch) {
        if (should_quit_) break;
        execute(b);
      }
      break;
  }
}

bool App::navigate_to(const std::string& raw, std::string& msg) {
  std::string target = trim(raw);
  YAML::Node n;
  if (is_literal_or_call(target)) {
    if (!evaluator_) { msg = "expression evaluation unavailable"; return false; }
    if (!evaluator_(root_, target, n, msg)) return false;
    if (!expr_origin_) expr_origin_ = path_;
    set_location(target, n);
    resolve_view();
    return true;
  }
  if (!node_at_path(root_, normalized_form(target), n, msg)) return false;
  expr_origin_.reset();
  set_location(display_form(target), n);
  resolve_view();
  return true;
}

void App::go_back() {
  std::string target;
  if (expr_origin_) {
    target = *expr_origin_;
    expr_origin_.reset();
  } else {
    if (path_ == "_") return;
    target = parent_path(path_);
  }
  YAML::Node n;
  std::string msg;
  if (!node_at_path(root_, normalized_form(target), n, msg)) { set_message(msg, true); return; }
  set_location(display_form(target), n);
  resolve_view();
}

void App::handle_key(int ch) {
  if (ch == NO_KEY || ch == KEY_RESIZE) return;
  if (views_.mode == ViewMode::Status) {
    message_.clear();
    forward_to_view(ch);
    return;
  }
  switch (mode_) {
    case Mode::Expr: handle_expr_key(ch); break;
    case Mode::Search: handle_search_key(ch); break;
    case Mode::Browse: handle_browse_key(ch); break;
  }
}

void App::forward_to_view(int ch) {
  CustomView v = active_custom_view(views_);
  if (v.empty()) return;
  apply(v.update(Event::key_press(ch)));
}

void App::handle_browse_key(int ch) {
  message_.clear();
  message_error_ = false;
  if (show_help_) { show_help_ = false; return; }

  int count = 1;
  if (key_mode_ == KeyMode::Vim) {
    if (input_seq_.consumeDigit(ch)) return;
    if (ch == 'g') {
      if (!input_seq_.consumeGg(ch)) return;
      ch = KEY_HOME;
    } else {
      input_seq_.consumeGg(ch);
    }
    if (input_seq_.hasCount()) count = static_cast<int>(input_seq_.takeCount());
  }

  Action a = resolve_action(ch, key_mode_);
  switch (a) {
    case Action::Expr: open_expr(); return;
    case Action::Search: open_search(); return;
    case Action::Help: show_help_ = true; return;
    case Action::Copy: copy_path(); return;
    default: break;
  }
  if (a != Action::Up && a != Action::Down) count = 1;

  for (int i = 0; i < count && !should_quit_; ++i) {
    if (views_.mode == ViewMode::Table) handle_table_action(a, ch);
    else forward_to_view(ch);
  }
}

void App::handle_table_action(Action a, int ch) {
  std::vector<Row> rows = visible_rows();
  int n = static_cast<int>(rows.size());
  switch (a) {
    case Action::Up: if (selected_ > 0) selected_--; break;
    case Action::Down: if (selected_ < n - 1) selected_++; break;
    case Action::Top: selected_ = 0; break;
    case Action::Bottom: selected_ = std::max(0, n - 1); break;
    case Action::Forward:
    case Action::Enter: {
      if (n == 0 || !(node_.IsMap() || node_.IsSequence())) break;
      if (expr_origin_) { set_message("cannot descend into an expression result", true); break; }
      const Row& r = rows[std::min(selected_, n - 1)];
      std::string child = node_.IsMap() ? path_ + render_segment(r.key) : path_ + r.key;
      std::string msg;
      if (!navigate_to(child, msg)) set_message(msg, true);
      break;
    }
    case Action::Back:
      if (!query_.empty()) { query_.clear(); selected_ = 0; break; }
      go_back();
      break;
    case Action::Quit:
      should_quit_ = true;
      break;
    default:
      if (ch == ESC && !query_.empty()) { query_.clear(); selected_ = 0; }
      break;
  }
}

std::vector<Row> App::visible_rows() const {
  std::vector<Row> rows = node_rows(node_);
  if (query_.empty()) return rows;
  std::vector<Row> out;
  for (const auto& r : rows) {
    if (contains_ci(r.key, query_) || contains_ci(r.value, query_)) out.push_back(r);
  }
  return out;
}

void App::open_expr() {
  mode_ = Mode::Expr;
  input_ = path_;
  input_cursor_ = static_cast<int>(input_.size());
  completion_.refresh(input_, root_);
}

void App::open_search() {
  CustomView v = active_custom_view(views_);
  if (!v.empty() && !v.handles_search()) {
    set_message("search is not available in " + std::string(view_mode_name(views_.mode)) + " view", true);
    return;
  }
  if (!v.empty()) query_ = v.list()->filter();
  mode_ = Mode::Search;
}

void App::update_search() {
  CustomView v = active_custom_view(views_);
  if (!v.empty() && v.handles_search()) {
    v.list()->set_filter(query_);
    return;
  }
  selected_ = 0;
  vp_ = Viewport{};
}

static bool is_backspace(int ch) {
  return ch == KEY_BACKSPACE || ch == 127 || ch == 8;
}

static bool is_text_byte(int ch) {
  return ch >= 32 && ch < 256 && ch != 127;
}

void App::handle_search_key(int ch) {
  if (ch == ESC || ch == CTRL_c) {
    query_.clear();
    update_search();
    mode_ = Mode::Browse;
    return;
  }
  if (ch == '\n' || ch == '\r' || ch == KEY_ENTER) { mode_ = Mode::Browse; return; }
  if (ch == KEY_UP || ch == KEY_DOWN) {
    if (views_.mode == ViewMode::Table) handle_table_action(ch == KEY_UP ? Action::Up : Action::Down, ch);
    else forward_to_view(ch);
    return;
  }
  if (is_backspace(ch)) {
    if (query_.empty()) return;
    query_.pop_back();
    while (!query_.empty() && (static_cast<unsigned char>(query_.back()) & 0xC0) == 0x80) query_.pop_back();
    update_search();
    return;
  }
  if (is_text_byte(ch)) {
    query_.push_back(static_cast<char>(ch));
    update_search();
  }
}

void App::submit_expr() {
  std::string text = trim(input_);
  if (text.empty()) { mode_ = Mode::Browse; completion_.reset(); return; }
  if (!is_complete_path(text)) { set_message("incomplete expression: " + text, true); return; }
  std::string msg;
  if (!navigate_to(text, msg)) { set_message(msg, true); return; }
  set_message(std::string());
  mode_ = Mode::Browse;
  completion_.reset();
}

void App::handle_expr_key(int ch) {
  int len = static_cast<int>(input_.size());
  switch (ch) {
    case ESC:
    case CTRL_c:
      mode_ = Mode::Browse;
      completion_.reset();
      return;
    case '\n': case '\r': case KEY_ENTER:
      submit_expr();
      return;
    case '\t':
    case KEY_BTAB:
      input_ = completion_.cycle(input_, root_, ch == KEY_BTAB);
      input_cursor_ = static_cast<int>(input_.size());
      return;
    case KEY_UP: completion_.select_prev(); return;
    case KEY_DOWN: completion_.select_next(); return;
    case KEY_LEFT:
      if (input_cursor_ > 0) { input_cursor_--; return; }
      go_back();
      input_ = path_;
      input_cursor_ = static_cast<int>(input_.size());
      completion_.refresh(input_, root_);
      return;
    case KEY_RIGHT:
      if (input_cursor_ < len) { input_cursor_++; return; }
      completion_.accept_by_cursor_move();
      completion_.refresh(input_, root_);
      return;
    case KEY_END:
      input_cursor_ = len;
      completion_.accept_by_cursor_move();
      completion_.refresh(input_, root_);
      return;
    case KEY_HOME:
      input_cursor_ = 0;
      return;
    default:
      break;
  }
  if (is_backspace(ch)) {
    if (input_cursor_ == 0) return;
    int start = input_cursor_ - 1;
    while (start > 0 && (static_cast<unsigned char>(input_[start]) & 0xC0) == 0x80) start--;
    input_.erase(start, input_cursor_ - start);
    input_cursor_ = start;
  } else if (is_text_byte(ch)) {
    input_.insert(input_.begin() + input_cursor_, static_cast<char>(ch));
    input_cursor_++;
  } else {
    return;
  }
  completion_.refresh(input_, root_);
}

void App::copy_path() {
  std::string msg;
  if (!effects_.copy_to_clipboard(path_, msg)) { set_message(msg, true); return; }
  set_message("copied " + path_);
}

std::string App::table_footer() const {
  static const Action acts[] = {Action::Forward, Action::Back, Action::Search, Action::Expr,
                                Action::Copy, Action::Help, Action::Quit};
  std::string out;
  for (Action a : acts) {
    if (!out.empty()) out += "  ";
    out += display_key(binding_for(a, key_mode_), key_mode_) + " " + action_name(a);
  }
  return out;
}

std::vector<std::string> App::help_lines() const {
  static const Action acts[] = {Action::Up, Action::Down, Action::Back, Action::Forward, Action::Top,
                                Action::Bottom, Action::Search, Action::Expr, Action::Copy,
                                Action::Help, Action::Quit};
  std::vector<std::string> out;
  out.push_back(std::string("Keys (") + key_mode_name(key_mode_) + ")");
  for (Action a : acts)
    out.push_back("  " + pad_right(display_key(binding_for(a, key_mode_), key_mode_), 12) + action_name(a));
  out.push_back(std::string());
  out.push_back("Expression bar");
  out.push_back("  tab/shift+tab  cycle completions");
  out.push_back("  up/down        browse suggestions");
  out.push_back("  right/end      move cursor to end");
  out.push_back("  enter          go to path");
  out.push_back("  esc            close");
  std::string settings = "Settings:";
  for (const auto& name : registry_.names()) settings += " " + name.substr(name.find(' ') + 1);
  out.push_back(settings);
  out.push_back("Press any key to close");
  return out;
}

void App::render() {
  RenderSnapshot snap;
  snap.path = path_;
  snap.type_label = node_type_label(node_);
  snap.mode = mode_;
  snap.view_mode = views_.mode;
  snap.view = active_custom_view(views_);
  if (snap.view.empty()) {
    snap.rows = visible_rows();
    int n = static_cast<int>(snap.rows.size());
    if (selected_ >= n) selected_ = std::max(0, n - 1);
    snap.selected = selected_;
    snap.vp = &vp_;
  }
  if (mode_ == Mode::Search) {
    snap.input = query_;
    snap.input_cursor = static_cast<int>(query_.size());
    snap.search_title = snap.view.empty() ? std::string("Search") : snap.view.search_title();
  } else {
    snap.input = input_;
    snap.input_cursor = input_cursor_;
  }
  if (mode_ == Mode::Expr) {
    const auto& cands = completion_.state().candidates();
    int cursor = completion_.state().cursor();
    int start = cursor >= KVVIEW_SUGGESTION_LIMIT ? cursor - KVVIEW_SUGGESTION_LIMIT + 1 : 0;
    int end = std::min(static_cast<int>(cands.size()), start + KVVIEW_SUGGESTION_LIMIT);
    snap.suggestions.assign(cands.begin() + start, cands.begin() + end);
    snap.suggestion_cursor = cursor < 0 ? -1 : cursor - start;
  }
  snap.message = message_;
  snap.message_error = message_error_;
  snap.footer = snap.view.empty() ? table_footer() : snap.view.footer();
  snap.show_help = show_help_;
  if (show_help_) snap.help_lines = help_lines();
  snap.color = color_;
  renderer_.render(term_, snap);
}
