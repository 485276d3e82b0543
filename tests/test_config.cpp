#include "cmd_registry.hpp"
#include "file_reader.hpp"
#include "input.hpp"
#include "logging.hpp"
#include <spdlog/spdlog.h>
#include <cassert>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

static void test_registry_dispatch() {
  CommandRegistry reg;
  std::vector<std::string> got;
  reg.register_command("set keymode", [&](const std::vector<std::string>& a){ got = a; });
  reg.register_command("quit", [&](const std::vector<std::string>&){ got = {"quit"}; });

  std::string msg;
  assert(reg.execute_line("set keymode emacs", msg));
  assert(got.size() == 1 && got[0] == "emacs");
  assert(reg.execute_line("set keymode=function", msg));
  assert(got.size() == 1 && got[0] == "function");
  assert(reg.execute_line("set keymode", msg));
  assert(got.empty());
  assert(reg.execute_line("  quit  ", msg));
  assert(got.size() == 1 && got[0] == "quit");
  assert(reg.execute_line("", msg));

  assert(!reg.execute_line("set colour on", msg));
  assert(msg == "unknown command: set colour");
  assert(!reg.execute_line("frobnicate", msg));
  assert(msg == "unknown command: frobnicate");

  std::vector<std::string> names = reg.names();
  assert(names.size() == 2 && names[0] == "quit" && names[1] == "set keymode");
}

static void test_read_lines() {
  std::string path = "/tmp/kvview_test_rc";
  {
    std::ofstream out(path, std::ios::binary);
    out << "# comment\r\n:set keymode emacs\r\n\n  \" vim comment\n// slash comment\nset color off";
  }
  std::vector<std::string> lines;
  std::string msg;
  assert(read_lines(path, lines, msg));
  assert(lines.size() == 6);
  assert(lines[1] == ":set keymode emacs");
  assert(lines[5] == "set color off");

  std::vector<std::string> cmds = rc_command_lines(lines);
  assert(cmds.size() == 2);
  assert(cmds[0] == "set keymode emacs");
  assert(cmds[1] == "set color off");
  std::remove(path.c_str());

  {
    std::ofstream out(path);
  }
  assert(read_lines(path, lines, msg));
  assert(lines.empty());
  std::remove(path.c_str());

  assert(!read_lines("/nonexistent/kvviewrc", lines, msg));
  assert(msg == "can not open file: /nonexistent/kvviewrc");
}

static void test_input_sequences() {
  Input in;
  assert(!in.consumeGg('g'));
  assert(in.consumeGg('g'));
  assert(!in.consumeGg('g'));
  assert(!in.consumeGg('j'));
  assert(!in.consumeGg('g'));
  in.reset();
  assert(!in.consumeGg('g'));
  assert(in.consumeGg('g'));

  assert(!in.consumeDigit('0'));
  assert(in.consumeDigit('1'));
  assert(in.consumeDigit('2'));
  assert(in.consumeDigit('0'));
  assert(in.hasCount());
  assert(in.takeCount() == 120);
  assert(!in.hasCount());
  assert(!in.consumeDigit('x'));

  in.consumeDigit('5');
  in.consumeGg('g');
  in.reset();
  assert(!in.hasCount());
  assert(!in.consumeGg('g'));
}

static void test_logging_levels() {
  std::string msg;
  assert(!init_logging("/tmp/kvview_test.log", "chatty", msg));
  assert(msg == "unknown log level: chatty");
  assert(init_logging("/tmp/kvview_test.log", "info", msg));
  assert(spdlog::default_logger()->level() == spdlog::level::info);
  assert(set_log_level("warn", msg));
  assert(msg == "loglevel warning");
  assert(set_log_level("OFF", msg));
  assert(!set_log_level("loud", msg));
  disable_logging();
  std::remove("/tmp/kvview_test.log");
}

int main() {
  test_registry_dispatch();
  test_read_lines();
  test_input_sequences();
  test_logging_levels();
  return 0;
}
