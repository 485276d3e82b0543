/*
 * kvview_status_demo
 *
 * Purpose: device-login style status screen. A worker thread simulates the
 *          login poller and fulfils the completion promise after --timeout.
 * Usage: kvview_status_demo [--keymode vim|emacs|function] [--timeout SECONDS] [--log FILE]
 */
#include "app.hpp"
#include "display_schema.hpp"
#include "effects.hpp"
#include "event_loop.hpp"
#include "function_catalog.hpp"
#include "keybindings.hpp"
#include "logging.hpp"
#include "ncurses_terminal.hpp"
#include "status_view.hpp"
#include "terminal.hpp"
#include <chrono>
#include <condition_variable>
#include <future>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <yaml-cpp/yaml.h>

static const char* DATA = R"(
title: Sign in to Entra
url: https://microsoft.com/devicelogin
code: EH5HFPGJJ
user: user@example.com
messages:
  - To sign in, open the page below and enter the code.
  - Press c to copy the code or o to open the page.
)";

static const char* SCHEMA = R"(
displaySchema: v1
status:
  titleField: title
  messageField: messages
  waitMessage: Waiting for authentication...
  successMessage: Authenticated successfully!
  doneBehavior: exit-after-delay
  doneDelay: 2s
  displayFields:
    - {label: URL, field: url}
    - {label: Code, field: code}
  actions:
    - label: Copy code
      type: copy-value
      field: code
      keys: {vim: c, emacs: alt+c, function: f2}
    - label: Open URL
      type: open-url
      field: url
      keys: {vim: o, emacs: alt+o, function: f3}
)";

int main(int argc, char** argv) {
  KeyMode mode = KeyMode::Vim;
  int timeout_s = 10;
  std::string log_file;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--keymode" && i + 1 < argc) {
      if (!parse_key_mode(argv[++i], mode)) { std::cerr << "unknown keymode: " << argv[i] << "\n"; return 2; }
    } else if (a == "--timeout" && i + 1 < argc) {
      try { timeout_s = std::stoi(argv[++i]); } catch (const std::exception&) { std::cerr << "invalid timeout\n"; return 2; }
    } else if (a == "--log" && i + 1 < argc) {
      log_file = argv[++i];
    } else {
      std::cerr << "usage: kvview_status_demo [--keymode MODE] [--timeout SECONDS] [--log FILE]\n";
      return 2;
    }
  }

  std::string msg;
  disable_logging();
  if (!log_file.empty() && !init_logging(log_file, "debug", msg)) { std::cerr << msg << "\n"; return 1; }

  YAML::Node data = YAML::Load(DATA);
  DisplaySchema schema;
  if (!parse_display_schema(YAML::Load(SCHEMA), schema, msg)) { std::cerr << msg << "\n"; return 1; }

  std::promise<StatusResult> done;
  auto channel = StatusChannel::create(done);

  std::mutex mu;
  std::condition_variable cv;
  bool cancelled = false;
  std::thread poller([&] {
    std::unique_lock<std::mutex> lock(mu);
    if (cv.wait_for(lock, std::chrono::seconds(timeout_s), [&] { return cancelled; })) return;
    done.set_value(StatusResult::success("Authenticated as user@example.com"));
  });

  std::string result;
  {
    Terminal terminal;
    NcursesTerminal term(default_theme(), true);
    SystemEffects effects;
    App app(term, data, schema, FunctionCatalog::defaults(), effects);
    app.set_key_mode(mode);
    app.set_status_channel(channel);
    app.run();
    CustomView v = app.active_view();
    if (v.status()) result = status_phase_name(v.status()->phase());
  }

  {
    std::lock_guard<std::mutex> lock(mu);
    cancelled = true;
  }
  cv.notify_all();
  poller.join();
  std::cout << "status: " << result << std::endl;
  return 0;
}
