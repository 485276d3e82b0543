#include "path_address.hpp"
#include "text_util.hpp"
#include <cctype>

static inline bool is_ident_start(unsigned char c) { return std::isalpha(c) != 0 || c == '_'; }
static inline bool is_ident_char(unsigned char c) { return std::isalnum(c) != 0 || c == '_'; }

bool is_valid_identifier(const std::string& s) {
  if (s.empty() || !is_ident_start((unsigned char)s[0])) return false;
  for (unsigned char c : s) if (!is_ident_char(c)) return false;
  return true;
}

bool is_index_segment(const std::string& s) {
  if (s.empty()) return false;
  for (unsigned char c : s) if (std::isdigit(c) == 0) return false;
  return true;
}

// "_", "_.x", "_[0]" are rooted; "_x" and "__" are plain keys
static size_t root_prefix_len(const std::string& s) {
  if (s.empty() || s[0] != '_') return 0;
  if (s.size() == 1) return 1;
  if (s[1] == '.') return 2;
  if (s[1] == '[') return 1;
  return 0;
}

static std::string read_quoted(const std::string& s, size_t& i) {
  std::string out;
  ++i; // opening quote
  while (i < s.size()) {
    char c = s[i];
    if (c == '\\' && i + 1 < s.size()) { out.push_back(s[i + 1]); i += 2; continue; }
    if (c == '"') { ++i; return out; }
    out.push_back(c); ++i;
  }
  return out;
}

std::vector<std::string> split_segments(const std::string& path) {
  std::vector<std::string> segs;
  std::string s = trim(path);
  size_t i = root_prefix_len(s);
  while (i < s.size()) {
    char c = s[i];
    if (c == '.') { ++i; continue; }
    if (c == '[') {
      ++i;
      while (i < s.size() && s[i] == ' ') ++i;
      std::string seg;
      if (i < s.size() && s[i] == '"') {
        seg = read_quoted(s, i);
        while (i < s.size() && s[i] != ']') ++i;
      } else {
        size_t st = i;
        while (i < s.size() && s[i] != ']') ++i;
        seg = trim(s.substr(st, i - st));
      }
      if (i < s.size()) ++i; // closing bracket
      segs.push_back(seg);
      continue;
    }
    if (c == '"') { segs.push_back(read_quoted(s, i)); continue; }
    size_t st = i;
    while (i < s.size() && s[i] != '.' && s[i] != '[') ++i;
    std::string seg = s.substr(st, i - st);
    if (!seg.empty()) segs.push_back(seg);
  }
  return segs;
}

std::string render_segment(const std::string& seg) {
  if (is_index_segment(seg)) return "[" + seg + "]";
  if (is_valid_identifier(seg)) return "." + seg;
  std::string out = "[\"";
  for (char c : seg) {
    if (c == '"' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  return out + "\"]";
}

std::string join_segments(const std::vector<std::string>& segs) {
  std::string out = "_";
  for (const auto& s : segs) out += render_segment(s);
  return out;
}

bool is_literal_or_call(const std::string& s) {
  if (s.empty()) return false;
  if (s[0] == '"' || s[0] == '[' || s[0] == '{') return true;
  bool in_quote = false;
  for (size_t i = 0; i < s.size(); ++i) {
    char c = s[i];
    if (in_quote) {
      if (c == '\\') { ++i; continue; }
      if (c == '"') in_quote = false;
      continue;
    }
    if (c == '"') in_quote = true;
    else if (c == '(' || c == ')') return true;
  }
  return false;
}

std::string display_form(const std::string& raw) {
  std::string s = trim(raw);
  if (s.empty() || s == "_") return "_";
  if (is_literal_or_call(s)) return s;
  return join_segments(split_segments(s));
}

std::string normalized_form(const std::string& raw) {
  std::string s = trim(raw);
  if (s.empty() || s == "_") return std::string();
  if (is_literal_or_call(s)) return s;
  auto segs = split_segments(s);
  if (segs.empty()) return std::string();
  return join_segments(segs);
}

std::string build_child_path(const std::string& base, const std::string& key) {
  std::string b = trim(base);
  if (b.empty()) b = "_";
  if (key.size() >= 2 && key.front() == '[' && key.back() == ']') return b + key;
  return b + render_segment(key);
}

std::string parent_path(const std::string& path) {
  auto segs = split_segments(path);
  if (!segs.empty()) segs.pop_back();
  return join_segments(segs);
}

bool is_complete_path(const std::string& input) {
  std::string s = trim(input);
  if (s.empty()) return false;
  if (s == "_") return true;
  bool in_quote = false;
  int brackets = 0, parens = 0, braces = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    char c = s[i];
    if (in_quote) {
      if (c == '\\') { ++i; continue; }
      if (c == '"') in_quote = false;
      continue;
    }
    switch (c) {
      case '"': in_quote = true; break;
      case '[': brackets++; break;
      case ']': if (--brackets < 0) return false; break;
      case '(': parens++; break;
      case ')': if (--parens < 0) return false; break;
      case '{': braces++; break;
      case '}': if (--braces < 0) return false; break;
      default: break;
    }
  }
  if (in_quote || brackets != 0 || parens != 0 || braces != 0) return false;
  unsigned char last = (unsigned char)s.back();
  return last == ']' || last == ')' || last == '}' || last == '"' || is_ident_char(last);
}

static void scan_separators(const std::string& s, int& last_dot, int& last_sep) {
  last_dot = -1; last_sep = -1;
  bool in_quote = false;
  int depth = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    char c = s[i];
    if (in_quote) {
      if (c == '\\') { ++i; continue; }
      if (c == '"') in_quote = false;
      continue;
    }
    if (c == '"') { in_quote = true; continue; }
    if (c == '[') { if (depth == 0) last_sep = (int)i; depth++; continue; }
    if (c == ']') { if (depth > 0) depth--; continue; }
    if (c == '.' && depth == 0) { last_dot = (int)i; last_sep = (int)i; }
  }
}

int last_unquoted_dot(const std::string& input) {
  int dot, sep;
  scan_separators(input, dot, sep);
  return dot;
}

int last_separator(const std::string& input) {
  int dot, sep;
  scan_separators(input, dot, sep);
  return sep;
}

std::string strip_last_segment(const std::string& input) {
  int sep = last_separator(input);
  if (sep < 0) return std::string();
  return input.substr(0, sep);
}

std::string partial_token(const std::string& input) {
  int sep = last_separator(input);
  std::string tok = sep < 0 ? input : input.substr(sep + 1);
  if (sep >= 0 && input[sep] == '[') {
    if (!tok.empty() && tok.back() == ']') tok.pop_back();
    if (!tok.empty() && tok.front() == '"') tok.erase(tok.begin());
    if (!tok.empty() && tok.back() == '"') tok.pop_back();
  }
  if (sep < 0 && (tok == "_")) return std::string();
  return tok;
}

std::string base_for_global(const std::string& input) {
  std::string s = trim(input);
  if (!s.empty() && s.back() == '[') s.pop_back();
  if (!s.empty() && s.back() == '.') {
    s.pop_back();
  } else {
    int dot = last_unquoted_dot(s);
    if (dot >= 0) s = s.substr(0, dot);
  }
  if (s.empty()) return "_";
  return display_form(s);
}

std::string wrap_global_call(const std::string& function_name, const std::string& base_expr) {
  std::string n = trim(function_name);
  if (n.size() >= 2 && n.compare(n.size() - 2, 2, "()") == 0) n.resize(n.size() - 2);
  return n + "(" + base_expr + ")";
}
