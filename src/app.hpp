#pragma once
/*
 * App
 *
 * Purpose: host loop of the browser. Owns the current path/node, the
 *          browse/expression/search modes, the active custom view and the
 *          event loop that carries timer and async completion events.
 * Loop: render -> read_key (bounded by the next timer) -> key -> status
 *       channel -> due timers. A quit produced by a key pre-empts everything
 *       queued behind it in the same iteration.
 * Note: views only ever see events on this thread; worker threads talk to
 *       the UI through StatusChannel.
 */
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>
#include "cmd_registry.hpp"
#include "completion.hpp"
#include "custom_view.hpp"
#include "data_tree.hpp"
#include "display_schema.hpp"
#include "effects.hpp"
#include "event_loop.hpp"
#include "function_catalog.hpp"
#include "input.hpp"
#include "keybindings.hpp"
#include "iterminal.hpp"
#include "renderer.hpp"
#include "types.hpp"

class App {
public:
  App(ITerminal& term, const YAML::Node& root, DisplaySchema schema, FunctionCatalog catalog, Effects& effects);

  void set_key_mode(KeyMode m);
  void set_color(bool on) { color_ = on; }
  void set_status_channel(std::shared_ptr<StatusChannel> ch) { channel_ = std::move(ch); }
  void set_evaluator(Evaluator ev) { evaluator_ = std::move(ev); }

  bool load_rc(const std::filesystem::path& path, std::string& msg);
  void load_default_rc();
  bool execute_command_line(const std::string& line);
  void set_message(std::string msg, bool error = false);

  // resolves the first view (and starts the status screen if configured)
  void start();
  void run();
  // one loop iteration; false once the app should quit
  bool step();

  bool navigate_to(const std::string& path, std::string& msg);
  void handle_key(int ch);
  void dispatch(const Event& e);
  void process_events(EventLoop::Clock::time_point now = EventLoop::Clock::now());
  void render();

  const std::string& path() const { return path_; }
  const YAML::Node& node() const { return node_; }
  Mode mode() const { return mode_; }
  ViewMode view_mode() const { return views_.mode; }
  CustomView active_view() const { return active_custom_view(views_); }
  KeyMode key_mode() const { return key_mode_; }
  bool color() const { return color_; }
  bool should_quit() const { return should_quit_; }
  bool show_help() const { return show_help_; }
  const std::string& message() const { return message_; }
  const std::string& input() const { return input_; }
  int input_cursor() const { return input_cursor_; }
  const std::string& query() const { return query_; }
  int selected() const { return selected_; }
  std::vector<Row> visible_rows() const;
  const CompletionEngine& completion() const { return completion_; }
  const FunctionCatalog& catalog() const { return catalog_; }
  EventLoop& loop() { return loop_; }
  int flash_ms() const { return flash_ms_; }

private:
  void register_commands();

  void set_location(const std::string& path, const YAML::Node& n);
  void resolve_view();
  void apply(ViewUpdate u);
  void execute(const Command& c);
  void effect_failed(const std::string& msg);
  void go_back();

  void handle_browse_key(int ch);
  void handle_table_action(Action a, int ch);
  void handle_expr_key(int ch);
  void handle_search_key(int ch);
  void forward_to_view(int ch);
  void open_expr();
  void open_search();
  void submit_expr();
  void update_search();
  void copy_path();
  std::vector<std::string> help_lines() const;
  std::string table_footer() const;

  ITerminal& term_;
  Renderer renderer_;
  YAML::Node root_;
  DisplaySchema schema_;
  FunctionCatalog catalog_;
  CompletionEngine completion_;
  Effects& effects_;
  Evaluator evaluator_;
  std::shared_ptr<StatusChannel> channel_;
  CommandRegistry registry_;
  EventLoop loop_;
  Input input_seq_;

  KeyMode key_mode_;
  bool color_ = true;
  int flash_ms_;
  bool started_ = false;
  bool should_quit_ = false;
  bool show_help_ = false;

  Mode mode_ = Mode::Browse;
  std::string path_ = "_";
  YAML::Node node_;
  // set when the current node came from the evaluator; back returns here
  std::optional<std::string> expr_origin_;
  ViewState views_;
  int selected_ = 0;
  Viewport vp_;
  std::map<std::string, int> remembered_;

  std::string message_;
  bool message_error_ = false;
  std::string input_;
  int input_cursor_ = 0;
  std::string query_;
};
