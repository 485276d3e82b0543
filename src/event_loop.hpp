#pragma once
/*
 * EventLoop
 *
 * Purpose: single-threaded queue of posted events plus delayed timer events.
 * Usage: schedule(delay, ev); the host pops ready events each iteration and
 *        sleeps in read_key for at most next_timeout_ms().
 * Note: timers due at the same instant fire in scheduling order.
 *
 * StatusChannel
 *
 * Purpose: one-shot completion signal from a worker thread to the UI thread.
 * Note: the producer's set_value never blocks; poll() never waits and yields
 *       the result at most once.
 */
#include <chrono>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include "event.hpp"

class EventLoop {
public:
  using Clock = std::chrono::steady_clock;

  void post(Event e) { posted_.push_back(std::move(e)); }
  void schedule(std::chrono::milliseconds delay, Event e, Clock::time_point now = Clock::now());
  bool pop(Event& out, Clock::time_point now = Clock::now());
  int next_timeout_ms(int idle_ms, Clock::time_point now = Clock::now()) const;
  void clear();

private:
  std::deque<Event> posted_;
  std::multimap<Clock::time_point, Event> timers_;
};

class StatusChannel {
public:
  explicit StatusChannel(std::future<StatusResult> f) : future_(std::move(f)) {}
  static std::shared_ptr<StatusChannel> create(std::promise<StatusResult>& producer);

  bool poll(StatusResult& out);
  bool consumed() const { return consumed_; }

private:
  std::future<StatusResult> future_;
  bool consumed_ = false;
};
