#include "event_loop.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

Command Command::join(std::vector<Command> cmds) {
  cmds.erase(std::remove_if(cmds.begin(), cmds.end(), [](const Command& c){ return c.empty(); }), cmds.end());
  if (cmds.empty()) return Command::none();
  if (cmds.size() == 1) return std::move(cmds.front());
  Command c;
  c.type = Type::Batch;
  c.batch = std::move(cmds);
  return c;
}

bool contains_command(const Command& cmd, Command::Type t) {
  if (cmd.type == t) return true;
  for (const auto& c : cmd.batch) if (contains_command(c, t)) return true;
  return false;
}

void EventLoop::schedule(std::chrono::milliseconds delay, Event e, Clock::time_point now) {
  timers_.emplace(now + delay, std::move(e));
}

bool EventLoop::pop(Event& out, Clock::time_point now) {
  if (!posted_.empty()) {
    out = std::move(posted_.front());
    posted_.pop_front();
    return true;
  }
  auto it = timers_.begin();
  if (it == timers_.end() || it->first > now) return false;
  out = std::move(it->second);
  timers_.erase(it);
  return true;
}

int EventLoop::next_timeout_ms(int idle_ms, Clock::time_point now) const {
  if (!posted_.empty()) return 0;
  if (timers_.empty()) return idle_ms;
  auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(timers_.begin()->first - now).count();
  if (wait < 0) wait = 0;
  return static_cast<int>(std::min<long long>(wait, idle_ms));
}

void EventLoop::clear() {
  posted_.clear();
  timers_.clear();
}

std::shared_ptr<StatusChannel> StatusChannel::create(std::promise<StatusResult>& producer) {
  return std::make_shared<StatusChannel>(producer.get_future());
}

bool StatusChannel::poll(StatusResult& out) {
  if (consumed_ || !future_.valid()) return false;
  if (future_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) return false;
  consumed_ = true;
  try {
    out = future_.get();
  } catch (const std::future_error& e) {
    spdlog::warn("status channel: {}", e.what());
    out = StatusResult::failure("operation abandoned");
  } catch (const std::exception& e) {
    out = StatusResult::failure(e.what());
  }
  return true;
}
