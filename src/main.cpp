#include "app.hpp"
#include "data_tree.hpp"
#include "display_schema.hpp"
#include "effects.hpp"
#include "function_catalog.hpp"
#include "keybindings.hpp"
#include "logging.hpp"
#include "ncurses_terminal.hpp"
#include "path_address.hpp"
#include "terminal.hpp"
#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

struct CliOptions {
  std::filesystem::path data_file;
  std::optional<std::filesystem::path> schema_file;
  std::optional<std::filesystem::path> rc_file;
  std::optional<KeyMode> key_mode;
  std::optional<std::string> log_file;
  std::string start_path;
  bool no_color = false;
};

static void usage(std::ostream& os) {
  os << "usage: kvview [options] DATA_FILE\n"
        "  --schema FILE    display schema (list/detail/status)\n"
        "  --keymode MODE   vim, emacs or function\n"
        "  --no-color       draw without colors\n"
        "  --log FILE       write debug log to FILE\n"
        "  --path PATH      start at PATH (e.g. _.items[0])\n"
        "  --rc FILE        read commands from FILE instead of ~/.kvviewrc\n";
}

static bool parse_args(int argc, char** argv, CliOptions& opt, std::string& msg) {
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto value = [&](std::string& out) {
      if (i + 1 >= argc) { msg = a + " needs a value"; return false; }
      out = argv[++i];
      return true;
    };
    std::string v;
    if (a == "--schema") { if (!value(v)) return false; opt.schema_file = v; }
    else if (a == "--rc") { if (!value(v)) return false; opt.rc_file = v; }
    else if (a == "--log") { if (!value(v)) return false; opt.log_file = v; }
    else if (a == "--path") { if (!value(v)) return false; opt.start_path = v; }
    else if (a == "--keymode") {
      if (!value(v)) return false;
      KeyMode m;
      if (!parse_key_mode(v, m)) { msg = "unknown keymode: " + v; return false; }
      opt.key_mode = m;
    }
    else if (a == "--no-color") opt.no_color = true;
    else if (!a.empty() && a[0] == '-') { msg = "unknown option: " + a; return false; }
    else if (opt.data_file.empty()) opt.data_file = a;
    else { msg = "unexpected argument: " + a; return false; }
  }
  if (opt.data_file.empty()) { msg = "missing DATA_FILE"; return false; }
  return true;
}

int main(int argc, char** argv) {
  if (argc >= 2 && (std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0)) {
    usage(std::cout);
    return 0;
  }
  CliOptions opt;
  std::string msg;
  if (!parse_args(argc, argv, opt, msg)) {
    std::cerr << "kvview: " << msg << "\n";
    usage(std::cerr);
    return 2;
  }

  disable_logging();
  if (opt.log_file && !init_logging(*opt.log_file, "debug", msg)) {
    std::cerr << "kvview: " << msg << "\n";
    return 1;
  }

  YAML::Node root;
  if (!load_data_file(opt.data_file, root, msg)) {
    std::cerr << "kvview: " << msg << "\n";
    return 1;
  }
  DisplaySchema schema;
  if (opt.schema_file && !load_display_schema(*opt.schema_file, schema, msg)) {
    std::cerr << "kvview: " << msg << "\n";
    return 1;
  }

  std::string final_path;
  {
    Terminal terminal;
    Theme theme = opt.no_color ? monochrome_theme() : default_theme();
    NcursesTerminal term(theme, !opt.no_color);
    SystemEffects effects;
    App app(term, root, schema, FunctionCatalog::defaults(), effects);

    if (opt.rc_file) {
      if (!app.load_rc(*opt.rc_file, msg)) app.set_message(msg, true);
    } else {
      app.load_default_rc();
    }
    if (opt.key_mode) app.set_key_mode(*opt.key_mode);
    if (opt.no_color) app.set_color(false);
    if (!opt.start_path.empty() && !app.navigate_to(opt.start_path, msg)) {
      app.set_message("start path " + opt.start_path + ": " + msg, true);
    }
    app.run();
    final_path = app.path();
  }
  std::cout << display_form(final_path) << std::endl;
  return 0;
}
