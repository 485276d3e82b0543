#include "app.hpp"
#include "keybindings.hpp"
#include "logging.hpp"
#include "status_view.hpp"
#include <algorithm>
#include <cctype>
#include <string>

void App::register_commands() {
  registry_.register_command("set keymode", [this](const std::vector<std::string>& args){
    KeyMode m;
    if (args.empty() || !parse_key_mode(args[0], m)) { set_message("set keymode: use vim|emacs|function", true); return; }
    set_key_mode(m);
    set_message(std::string("keymode ") + key_mode_name(m));
  });
  registry_.register_command("set color", [this](const std::vector<std::string>& args){
    if (args.empty()) {
      color_ = !color_;
      set_message(color_ ? "color on" : "color off");
      return;
    }
    const std::string& v = args[0];
    if (v == "on") { color_ = true; set_message("color on"); }
    else if (v == "off") { color_ = false; set_message("color off"); }
    else { set_message("set color: use on|off", true); }
  });
  registry_.register_command("set logfile", [this](const std::vector<std::string>& args){
    if (args.empty()) { set_message("set logfile: use set logfile <path>", true); return; }
    std::string msg;
    bool ok = init_logging(args[0], args.size() > 1 ? args[1] : std::string(), msg);
    set_message(msg, !ok);
  });
  registry_.register_command("set loglevel", [this](const std::vector<std::string>& args){
    if (args.empty()) { set_message("set loglevel: use trace|debug|info|warn|error|off", true); return; }
    std::string msg;
    bool ok = set_log_level(args[0], msg);
    set_message(msg, !ok);
  });
  registry_.register_command("set functions", [this](const std::vector<std::string>& args){
    if (args.empty()) { set_message("set functions: use set functions <path>", true); return; }
    std::string msg;
    bool ok = catalog_.load_file(args[0], msg);
    set_message(msg, !ok);
  });
  registry_.register_command("set flash", [this](const std::vector<std::string>& args){
    if (args.empty()) { set_message("set flash: use set flash <milliseconds>", true); return; }
    const std::string& s = args[0];
    bool digits = !s.empty() && s.size() <= 7 &&
                  std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
    if (!digits) { set_message("set flash: duration must be a number of milliseconds", true); return; }
    flash_ms_ = std::stoi(s);
    if (views_.status) views_.status->set_flash_duration(std::chrono::milliseconds(flash_ms_));
    set_message("flash " + s + "ms");
  });
}
