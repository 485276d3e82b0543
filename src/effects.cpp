#include "effects.hpp"
#include <cstdio>
#include <cstdlib>
#include <spdlog/spdlog.h>

static bool on_path(const std::string& tool) {
  std::string probe = "command -v " + tool + " >/dev/null 2>&1";
  return std::system(probe.c_str()) == 0;
}

static std::string shell_quote(const std::string& s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'') out += "'\\''";
    else out += c;
  }
  out += "'";
  return out;
}

bool SystemEffects::copy_to_clipboard(const std::string& text, std::string& msg) {
  static const char* tools[] = {"wl-copy", "xclip -selection clipboard", "xsel --clipboard --input", "pbcopy"};
  for (const char* t : tools) {
    std::string cmd = t;
    std::string exe = cmd.substr(0, cmd.find(' '));
    if (!on_path(exe)) continue;
    FILE* p = ::popen((cmd + " 2>/dev/null").c_str(), "w");
    if (!p) continue;
    size_t written = std::fwrite(text.data(), 1, text.size(), p);
    int rc = ::pclose(p);
    if (written == text.size() && rc == 0) {
      spdlog::debug("copied {} bytes with {}", text.size(), exe);
      return true;
    }
    spdlog::warn("{} failed with status {}", exe, rc);
  }
  msg = "no clipboard tool available (wl-copy, xclip, xsel, pbcopy)";
  return false;
}

bool SystemEffects::open_url(const std::string& url, std::string& msg) {
  static const char* tools[] = {"xdg-open", "open"};
  for (const char* t : tools) {
    if (!on_path(t)) continue;
    std::string cmd = std::string(t) + " " + shell_quote(url) + " >/dev/null 2>&1 &";
    int rc = std::system(cmd.c_str());
    if (rc == 0) {
      spdlog::debug("opened {} with {}", url, t);
      return true;
    }
    spdlog::warn("{} failed with status {}", t, rc);
  }
  msg = "no browser launcher available (xdg-open, open)";
  return false;
}

bool RecordingEffects::copy_to_clipboard(const std::string& text, std::string& msg) {
  if (fail) { msg = "clipboard unavailable"; return false; }
  copied.push_back(text);
  return true;
}

bool RecordingEffects::open_url(const std::string& url, std::string& msg) {
  if (fail) { msg = "browser unavailable"; return false; }
  opened.push_back(url);
  return true;
}
