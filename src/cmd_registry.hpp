#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch rc-file commands ("set keymode emacs").
 * Design: map name -> handler (args vector). `set name value` and
 *         `set name=value` both dispatch to the composite "set name".
 */
#include <algorithm>
#include <functional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

class CommandRegistry {
public:
  using Handler = std::function<void(const std::vector<std::string>&)>;

  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }

  bool execute(const std::string& name, const std::vector<std::string>& args) const {
    auto it = map_.find(name);
    if (it == map_.end()) return false;
    it->second(args);
    return true;
  }

  // false with msg when no handler matches the line
  bool execute_line(const std::string& line, std::string& msg) const {
    std::istringstream iss(line);
    std::string cmd; iss >> cmd;
    std::vector<std::string> args; std::string a;
    while (iss >> a) args.push_back(a);
    if (cmd.empty()) return true;
    if (cmd == "set" && !args.empty()) {
      std::string name = args[0];
      std::vector<std::string> subargs;
      size_t eq = name.find('=');
      if (eq != std::string::npos) {
        if (eq + 1 < name.size()) subargs.push_back(name.substr(eq + 1));
        name = name.substr(0, eq);
      }
      subargs.insert(subargs.end(), args.begin() + 1, args.end());
      std::string composite = "set " + name;
      if (!execute(composite, subargs)) { msg = "unknown command: " + composite; return false; }
      return true;
    }
    if (!execute(cmd, args)) { msg = "unknown command: " + cmd; return false; }
    return true;
  }

  std::vector<std::string> names() const {
    std::vector<std::string> out;
    for (const auto& kv : map_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
  }

private:
  std::unordered_map<std::string, Handler> map_;
};
