#pragma once
/*
 * Event / Command
 *
 * Purpose: messages flowing into views (keys, timers, async completion) and
 *          the follow-up requests views hand back to the host loop.
 * Note: commands are plain values; the host executes them (quit, schedule a
 *       timer event, clipboard/browser side effects, navigation).
 */
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

struct StatusResult {
  bool ok = true;
  std::string message;
  std::string error;
  static StatusResult success(std::string msg = std::string()) { return {true, std::move(msg), std::string()}; }
  static StatusResult failure(std::string err) { return {false, std::string(), std::move(err)}; }
};

struct Event {
  enum class Type { Key, SpinnerTick, StatusDone, StatusTimeout, DoneTimer, FlashClear };
  Type type = Type::Key;
  int key = 0;
  uint64_t flash_id = 0;
  StatusResult result;

  static Event key_press(int k) { Event e; e.type = Type::Key; e.key = k; return e; }
  static Event of(Type t) { Event e; e.type = t; return e; }
  static Event done(StatusResult r) { Event e; e.type = Type::StatusDone; e.result = std::move(r); return e; }
  static Event flash_clear(uint64_t id) { Event e; e.type = Type::FlashClear; e.flash_id = id; return e; }
};

struct Command {
  enum class Type { None, Quit, Schedule, CopyToClipboard, OpenUrl, Navigate, Back, Batch };
  Type type = Type::None;
  std::chrono::milliseconds delay{0};
  Event event;
  std::string payload;
  std::vector<Command> batch;

  bool empty() const { return type == Type::None; }

  static Command none() { return Command(); }
  static Command quit() { Command c; c.type = Type::Quit; return c; }
  static Command after(std::chrono::milliseconds d, Event e) {
    Command c; c.type = Type::Schedule; c.delay = d; c.event = std::move(e); return c;
  }
  static Command copy(std::string text) { Command c; c.type = Type::CopyToClipboard; c.payload = std::move(text); return c; }
  static Command open_url(std::string url) { Command c; c.type = Type::OpenUrl; c.payload = std::move(url); return c; }
  static Command navigate(std::string path) { Command c; c.type = Type::Navigate; c.payload = std::move(path); return c; }
  static Command back() { Command c; c.type = Type::Back; return c; }
  static Command join(std::vector<Command> cmds);
};

// does cmd (or any command batched inside it) have type t
bool contains_command(const Command& cmd, Command::Type t);
