#pragma once
/*
 * KeyBindings
 *
 * Purpose: map raw key codes to key names ("ctrl+q", "f10", "alt+w") and to
 *          logical actions for the active key mode (vim/emacs/function).
 * Note: arrows, Home/End, Enter, Ctrl-C and F1 resolve in every mode.
 *       vim `gg` is a two-key sequence assembled by Input, not resolved here.
 *       Alt combinations arrive as ALT_BIT | key from the terminal.
 */
#include <string>
#include "types.hpp"

static constexpr int ESC = 27;
static constexpr int ALT_BIT = 0x100000;
static constexpr int CTRL_c = 'C'-64;

enum class Action { None, Up, Down, Back, Forward, Enter, Quit, Help, Top, Bottom, Search, Expr, Copy };

std::string key_name(int key);
bool key_matches(int key, const std::string& binding);

Action resolve_action(int key, KeyMode mode);
const char* action_name(Action a);
std::string binding_for(Action a, KeyMode mode);

bool parse_key_mode(const std::string& s, KeyMode& out);
const char* key_mode_name(KeyMode m);
// "q" / "C-q" / "F10" as shown in footers
std::string display_key(const std::string& binding, KeyMode mode);
std::string quit_key(KeyMode mode);
