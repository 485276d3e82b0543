#pragma once
#include <string>
#include <vector>

std::string trim(const std::string& s);
std::string to_lower(std::string s);
bool has_prefix_ci(const std::string& s, const std::string& prefix);
bool contains_ci(const std::string& haystack, const std::string& needle);
int display_width(const std::string& s);
std::string truncate_to(const std::string& s, int width);
// cut at width code points, no ellipsis
std::string clip_to(const std::string& s, int width);
std::string pad_right(const std::string& s, int width);
std::vector<std::string> wrap_words(const std::string& s, int width);
std::vector<std::string> split_lines(const std::string& block);
