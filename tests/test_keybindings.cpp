#include "keybindings.hpp"
#include <ncurses.h>
#include <cassert>
#include <string>

static void test_key_names() {
  assert(key_name('j') == "j");
  assert(key_name('G') == "G");
  assert(key_name(CTRL_c) == "ctrl+c");
  assert(key_name('Q' - 64) == "ctrl+q");
  assert(key_name('\n') == "enter");
  assert(key_name(KEY_ENTER) == "enter");
  assert(key_name('\t') == "tab");
  assert(key_name(KEY_BTAB) == "shift+tab");
  assert(key_name(KEY_F(10)) == "f10");
  assert(key_name(ALT_BIT | 'w') == "alt+w");
  assert(key_name(ALT_BIT | '<') == "alt+<");
  assert(key_name(ESC) == "esc");
  assert(key_name(127) == "backspace");
  assert(key_name(' ') == "space");
}

static void test_key_matches() {
  assert(key_matches('c', "c"));
  assert(!key_matches('C', "c"));
  assert(key_matches(KEY_F(2), "F2"));
  assert(key_matches(ALT_BIT | 'c', "Alt+C"));
  assert(key_matches(ALT_BIT | 'c', "alt+c"));
  assert(key_matches('X' - 64, " ctrl+x "));
  assert(!key_matches('c', ""));
}

static void test_resolve_per_mode() {
  assert(resolve_action('j', KeyMode::Vim) == Action::Down);
  assert(resolve_action('k', KeyMode::Vim) == Action::Up);
  assert(resolve_action('h', KeyMode::Vim) == Action::Back);
  assert(resolve_action('l', KeyMode::Vim) == Action::Forward);
  assert(resolve_action('G', KeyMode::Vim) == Action::Bottom);
  assert(resolve_action('g', KeyMode::Vim) == Action::None);
  assert(resolve_action(':', KeyMode::Vim) == Action::Expr);
  assert(resolve_action('q', KeyMode::Vim) == Action::Quit);
  assert(resolve_action('j', KeyMode::Emacs) == Action::None);

  assert(resolve_action('N' - 64, KeyMode::Emacs) == Action::Down);
  assert(resolve_action('S' - 64, KeyMode::Emacs) == Action::Search);
  assert(resolve_action(ALT_BIT | 'x', KeyMode::Emacs) == Action::Expr);
  assert(resolve_action(ALT_BIT | '>', KeyMode::Emacs) == Action::Bottom);
  assert(resolve_action('Q' - 64, KeyMode::Emacs) == Action::Quit);
  assert(resolve_action('q', KeyMode::Emacs) == Action::None);

  assert(resolve_action(KEY_F(10), KeyMode::Function) == Action::Quit);
  assert(resolve_action(KEY_F(6), KeyMode::Function) == Action::Expr);
  assert(resolve_action('q', KeyMode::Function) == Action::None);

  // shared in every mode
  for (KeyMode m : {KeyMode::Vim, KeyMode::Emacs, KeyMode::Function}) {
    assert(resolve_action(KEY_UP, m) == Action::Up);
    assert(resolve_action(KEY_LEFT, m) == Action::Back);
    assert(resolve_action('\n', m) == Action::Enter);
    assert(resolve_action(KEY_HOME, m) == Action::Top);
    assert(resolve_action(CTRL_c, m) == Action::Quit);
    assert(resolve_action(KEY_F(1), m) == Action::Help);
  }
}

static void test_bindings_and_display() {
  assert(binding_for(Action::Top, KeyMode::Vim) == "gg");
  assert(binding_for(Action::Expr, KeyMode::Emacs) == "alt+x");
  assert(binding_for(Action::Copy, KeyMode::Function) == "f5");
  assert(display_key("ctrl+q", KeyMode::Emacs) == "C-q");
  assert(display_key("alt+w", KeyMode::Emacs) == "M-w");
  assert(display_key("f10", KeyMode::Function) == "F10");
  assert(display_key("q", KeyMode::Vim) == "q");
  assert(quit_key(KeyMode::Vim) == "q");
  assert(quit_key(KeyMode::Emacs) == "C-q");
  assert(quit_key(KeyMode::Function) == "F10");
  assert(std::string(action_name(Action::Search)) == "search");
}

static void test_key_modes() {
  KeyMode m = KeyMode::Vim;
  assert(parse_key_mode(" Emacs ", m) && m == KeyMode::Emacs);
  assert(parse_key_mode("function", m) && m == KeyMode::Function);
  assert(!parse_key_mode("nano", m));
  assert(m == KeyMode::Function);
  assert(std::string(key_mode_name(KeyMode::Vim)) == "vim");
}

int main() {
  test_key_names();
  test_key_matches();
  test_resolve_per_mode();
  test_bindings_and_display();
  test_key_modes();
  return 0;
}
