#include "logging.hpp"
#include "text_util.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

// from_str maps unknown names to off, so "off" itself is checked explicitly
static bool parse_level(const std::string& text, spdlog::level::level_enum& out) {
  std::string t = to_lower(trim(text));
  auto lvl = spdlog::level::from_str(t);
  if (lvl == spdlog::level::off && t != "off") return false;
  out = lvl;
  return true;
}

static std::string level_text(spdlog::level::level_enum lvl) {
  auto sv = spdlog::level::to_string_view(lvl);
  return std::string(sv.data(), sv.size());
}

bool init_logging(const std::string& path, const std::string& level, std::string& msg) {
  spdlog::level::level_enum lvl = spdlog::level::debug;
  if (!level.empty() && !parse_level(level, lvl)) { msg = "unknown log level: " + level; return false; }
  try {
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false);
    auto logger = std::make_shared<spdlog::logger>("kvview", sink);
    logger->set_level(lvl);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
  } catch (const spdlog::spdlog_ex& e) {
    msg = std::string("can not open log file: ") + e.what();
    return false;
  }
  spdlog::info("logging to {} at level {}", path, level_text(lvl));
  msg = "logging to " + path;
  return true;
}

bool set_log_level(const std::string& level, std::string& msg) {
  spdlog::level::level_enum lvl;
  if (!parse_level(level, lvl)) { msg = "unknown log level: " + level; return false; }
  spdlog::set_level(lvl);
  msg = "loglevel " + level_text(lvl);
  return true;
}

void disable_logging() {
  spdlog::set_level(spdlog::level::off);
}
