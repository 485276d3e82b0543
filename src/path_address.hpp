#pragma once
/*
 * PathAddress
 *
 * Purpose: parse and render the path micro-language used by the expression bar.
 * Grammar: `_` root marker, then `.ident`, `["quoted"]` or `[N]` segments.
 * Forms:
 *   display    - canonical and always rooted ("_", "_.a[0]")
 *   normalized - navigation form; root is the empty string
 * Note: quoted text and bracket contents are opaque to dot/bracket scanning.
 *       All functions are total: malformed input degrades, never throws.
 */
#include <string>
#include <vector>

bool is_valid_identifier(const std::string& s);
bool is_index_segment(const std::string& s);

// keys come back unquoted, indices as decimal strings; root-only -> empty
std::vector<std::string> split_segments(const std::string& path);
std::string render_segment(const std::string& seg);
std::string join_segments(const std::vector<std::string>& segs);

bool is_literal_or_call(const std::string& s);
std::string display_form(const std::string& raw);
std::string normalized_form(const std::string& raw);

std::string build_child_path(const std::string& base, const std::string& key);
std::string parent_path(const std::string& path);

bool is_complete_path(const std::string& input);

int last_unquoted_dot(const std::string& input);
// last top-level '.' or '[' outside quotes; -1 when the input has none
int last_separator(const std::string& input);
std::string strip_last_segment(const std::string& input);
std::string partial_token(const std::string& input);

std::string base_for_global(const std::string& input);
std::string wrap_global_call(const std::string& function_name, const std::string& base_expr);
