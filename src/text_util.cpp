#include "text_util.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return (j > i) ? s.substr(i, j - i) : std::string();
}

std::string to_lower(std::string s) {
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

bool has_prefix_ci(const std::string& s, const std::string& prefix) {
  if (prefix.size() > s.size()) return false;
  for (size_t i = 0; i < prefix.size(); ++i) {
    if (std::tolower((unsigned char)s[i]) != std::tolower((unsigned char)prefix[i])) return false;
  }
  return true;
}

bool contains_ci(const std::string& haystack, const std::string& needle) {
  if (needle.empty()) return true;
  return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

static size_t utf8_len(unsigned char lead) {
  if (lead < 0x80) return 1;
  if ((lead >> 5) == 0x6) return 2;
  if ((lead >> 4) == 0xE) return 3;
  if ((lead >> 3) == 0x1E) return 4;
  return 1;
}

int display_width(const std::string& s) {
  int w = 0;
  for (size_t i = 0; i < s.size(); i += utf8_len((unsigned char)s[i])) w++;
  return w;
}

std::string truncate_to(const std::string& s, int width) {
  if (width <= 0) return std::string();
  if (display_width(s) <= width) return s;
  if (width <= 3) return std::string(width, '.');
  std::string out;
  int w = 0;
  for (size_t i = 0; i < s.size() && w < width - 3; ) {
    size_t n = utf8_len((unsigned char)s[i]);
    out.append(s, i, n);
    i += n; w++;
  }
  return out + "...";
}

std::string clip_to(const std::string& s, int width) {
  if (width <= 0) return std::string();
  size_t i = 0;
  for (int w = 0; i < s.size() && w < width; ++w) i += utf8_len((unsigned char)s[i]);
  return s.substr(0, std::min(i, s.size()));
}

std::string pad_right(const std::string& s, int width) {
  int w = display_width(s);
  if (w >= width) return s;
  return s + std::string(width - w, ' ');
}

std::vector<std::string> wrap_words(const std::string& s, int width) {
  std::vector<std::string> out;
  if (width <= 0) return out;
  std::istringstream iss(s);
  std::string word, line;
  while (iss >> word) {
    while (display_width(word) > width) {
      if (!line.empty()) { out.push_back(line); line.clear(); }
      out.push_back(word.substr(0, width));
      word = word.substr(width);
    }
    if (line.empty()) line = word;
    else if (display_width(line) + 1 + display_width(word) <= width) line += " " + word;
    else { out.push_back(line); line = word; }
  }
  if (!line.empty()) out.push_back(line);
  return out;
}

std::vector<std::string> split_lines(const std::string& block) {
  std::vector<std::string> lines;
  size_t st = 0;
  while (st <= block.size()) {
    size_t pos = block.find('\n', st);
    if (pos == std::string::npos) { lines.emplace_back(block.substr(st)); break; }
    lines.emplace_back(block.substr(st, pos - st));
    st = pos + 1;
  }
  return lines;
}
