#include "keybindings.hpp"
#include "text_util.hpp"
#include <ncurses.h>

std::string key_name(int key) {
  if (key & ALT_BIT) return "alt+" + key_name(key & ~ALT_BIT);
  switch (key) {
    case ESC: return "esc";
    case '\n': case '\r': case KEY_ENTER: return "enter";
    case '\t': return "tab";
    case KEY_BTAB: return "shift+tab";
    case KEY_BACKSPACE: case 127: case 8: return "backspace";
    case KEY_UP: return "up";
    case KEY_DOWN: return "down";
    case KEY_LEFT: return "left";
    case KEY_RIGHT: return "right";
    case KEY_HOME: return "home";
    case KEY_END: return "end";
    case KEY_PPAGE: return "pgup";
    case KEY_NPAGE: return "pgdown";
    case KEY_DC: return "delete";
    case KEY_RESIZE: return "resize";
    case ' ': return "space";
    case 0: return "ctrl+space";
    default: break;
  }
  for (int n = 1; n <= 12; ++n) if (key == KEY_F(n)) return "f" + std::to_string(n);
  if (key >= 1 && key <= 26) return std::string("ctrl+") + static_cast<char>('a' + key - 1);
  if (key >= 32 && key < 127) return std::string(1, static_cast<char>(key));
  return "key" + std::to_string(key);
}

bool key_matches(int key, const std::string& binding) {
  std::string b = trim(binding);
  if (b.empty()) return false;
  if (b.size() > 1) b = to_lower(b);
  return key_name(key) == b;
}

static Action vim_action(const std::string& k) {
  if (k == "j") return Action::Down;
  if (k == "k") return Action::Up;
  if (k == "h") return Action::Back;
  if (k == "l") return Action::Forward;
  if (k == "/") return Action::Search;
  if (k == "G") return Action::Bottom;
  if (k == "?") return Action::Help;
  if (k == "y") return Action::Copy;
  if (k == ":") return Action::Expr;
  if (k == "q") return Action::Quit;
  return Action::None;
}

static Action emacs_action(const std::string& k) {
  if (k == "ctrl+n") return Action::Down;
  if (k == "ctrl+p") return Action::Up;
  if (k == "ctrl+b") return Action::Back;
  if (k == "ctrl+f") return Action::Forward;
  if (k == "ctrl+s") return Action::Search;
  if (k == "alt+<") return Action::Top;
  if (k == "alt+>") return Action::Bottom;
  if (k == "alt+w") return Action::Copy;
  if (k == "alt+x") return Action::Expr;
  if (k == "ctrl+q") return Action::Quit;
  return Action::None;
}

static Action function_action(const std::string& k) {
  if (k == "f3") return Action::Search;
  if (k == "f5") return Action::Copy;
  if (k == "f6") return Action::Expr;
  if (k == "f10") return Action::Quit;
  return Action::None;
}

Action resolve_action(int key, KeyMode mode) {
  std::string k = key_name(key);
  if (k == "up") return Action::Up;
  if (k == "down") return Action::Down;
  if (k == "left") return Action::Back;
  if (k == "right") return Action::Forward;
  if (k == "enter") return Action::Enter;
  if (k == "home") return Action::Top;
  if (k == "end") return Action::Bottom;
  if (k == "ctrl+c") return Action::Quit;
  if (k == "f1") return Action::Help;
  switch (mode) {
    case KeyMode::Vim: return vim_action(k);
    case KeyMode::Emacs: return emacs_action(k);
    case KeyMode::Function: return function_action(k);
  }
  return Action::None;
}

const char* action_name(Action a) {
  switch (a) {
    case Action::Up: return "up";
    case Action::Down: return "down";
    case Action::Back: return "back";
    case Action::Forward: return "forward";
    case Action::Enter: return "enter";
    case Action::Quit: return "quit";
    case Action::Help: return "help";
    case Action::Top: return "top";
    case Action::Bottom: return "bottom";
    case Action::Search: return "search";
    case Action::Expr: return "expr";
    case Action::Copy: return "copy";
    case Action::None: break;
  }
  return "none";
}

std::string binding_for(Action a, KeyMode mode) {
  static const char* vim[] = {"", "k", "j", "h", "l", "enter", "q", "?", "gg", "G", "/", ":", "y"};
  static const char* emacs[] = {"", "ctrl+p", "ctrl+n", "ctrl+b", "ctrl+f", "enter", "ctrl+q", "f1", "alt+<", "alt+>", "ctrl+s", "alt+x", "alt+w"};
  static const char* fkeys[] = {"", "up", "down", "left", "right", "enter", "f10", "f1", "home", "end", "f3", "f6", "f5"};
  int i = static_cast<int>(a);
  switch (mode) {
    case KeyMode::Vim: return vim[i];
    case KeyMode::Emacs: return emacs[i];
    case KeyMode::Function: return fkeys[i];
  }
  return std::string();
}

bool parse_key_mode(const std::string& s, KeyMode& out) {
  std::string m = to_lower(trim(s));
  if (m == "vim") { out = KeyMode::Vim; return true; }
  if (m == "emacs") { out = KeyMode::Emacs; return true; }
  if (m == "function") { out = KeyMode::Function; return true; }
  return false;
}

const char* key_mode_name(KeyMode m) {
  switch (m) {
    case KeyMode::Emacs: return "emacs";
    case KeyMode::Function: return "function";
    case KeyMode::Vim: break;
  }
  return "vim";
}

static void replace_all(std::string& s, const std::string& from, const std::string& to) {
  for (size_t p = s.find(from); p != std::string::npos; p = s.find(from, p + to.size())) s.replace(p, from.size(), to);
}

std::string display_key(const std::string& binding, KeyMode mode) {
  std::string k = binding;
  bool fkey = k.size() >= 2 && (k[0] == 'f' || k[0] == 'F') && k[1] >= '0' && k[1] <= '9';
  if (fkey) return "F" + k.substr(1);
  if (mode == KeyMode::Emacs) {
    replace_all(k, "ctrl+", "C-");
    replace_all(k, "alt+", "M-");
  }
  return k;
}

std::string quit_key(KeyMode mode) {
  return display_key(binding_for(Action::Quit, mode), mode);
}
