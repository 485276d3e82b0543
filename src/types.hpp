#pragma once
#include <string>

enum class Mode { Browse, Expr, Search };

enum class KeyMode { Vim, Emacs, Function };

enum class NodeKind { Map, Array, Scalar, Null };

struct Viewport { int top_line = 0; };

struct Row { std::string key; std::string value; };
