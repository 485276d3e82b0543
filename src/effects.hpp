#pragma once
/*
 * Effects
 *
 * Purpose: side effects requested by views (clipboard copy, open URL).
 * Design: App executes Command::CopyToClipboard / OpenUrl through this
 *         interface so tests can record effects instead of spawning tools.
 */
#include <string>
#include <vector>

class Effects {
public:
  virtual ~Effects() = default;
  virtual bool copy_to_clipboard(const std::string& text, std::string& msg) = 0;
  virtual bool open_url(const std::string& url, std::string& msg) = 0;
};

// wl-copy / xclip / pbcopy and xdg-open / open, whichever is on PATH
class SystemEffects : public Effects {
public:
  bool copy_to_clipboard(const std::string& text, std::string& msg) override;
  bool open_url(const std::string& url, std::string& msg) override;
};

class RecordingEffects : public Effects {
public:
  bool copy_to_clipboard(const std::string& text, std::string& msg) override;
  bool open_url(const std::string& url, std::string& msg) override;

  std::vector<std::string> copied;
  std::vector<std::string> opened;
  bool fail = false;
};
