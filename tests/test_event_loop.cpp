#include "event_loop.hpp"
#include <cassert>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

using namespace std::chrono;
using Clock = EventLoop::Clock;

static void test_posted_before_timers() {
  EventLoop loop;
  Clock::time_point t0 = Clock::now();
  loop.schedule(milliseconds(0), Event::of(Event::Type::SpinnerTick), t0);
  loop.post(Event::key_press('x'));
  Event e;
  assert(loop.pop(e, t0));
  assert(e.type == Event::Type::Key && e.key == 'x');
  assert(loop.pop(e, t0));
  assert(e.type == Event::Type::SpinnerTick);
  assert(!loop.pop(e, t0));
  assert(!loop.pop(e, t0 + milliseconds(1000)));
}

static void test_timer_ordering() {
  EventLoop loop;
  Clock::time_point t0 = Clock::now();
  loop.schedule(milliseconds(200), Event::of(Event::Type::DoneTimer), t0);
  loop.schedule(milliseconds(100), Event::flash_clear(1), t0);
  loop.schedule(milliseconds(100), Event::flash_clear(2), t0);

  Event e;
  assert(!loop.pop(e, t0 + milliseconds(99)));
  assert(loop.pop(e, t0 + milliseconds(100)));
  assert(e.type == Event::Type::FlashClear && e.flash_id == 1);
  assert(loop.pop(e, t0 + milliseconds(100)));
  assert(e.flash_id == 2);
  assert(!loop.pop(e, t0 + milliseconds(150)));
  assert(loop.pop(e, t0 + milliseconds(250)));
  assert(e.type == Event::Type::DoneTimer);
}

static void test_next_timeout() {
  EventLoop loop;
  Clock::time_point t0 = Clock::now();
  assert(loop.next_timeout_ms(100, t0) == 100);
  loop.schedule(milliseconds(40), Event::of(Event::Type::SpinnerTick), t0);
  assert(loop.next_timeout_ms(100, t0) == 40);
  assert(loop.next_timeout_ms(10, t0) == 10);
  assert(loop.next_timeout_ms(100, t0 + milliseconds(90)) == 0);
  loop.post(Event::key_press('a'));
  assert(loop.next_timeout_ms(100, t0) == 0);
  loop.clear();
  assert(loop.next_timeout_ms(100, t0) == 100);
  Event e;
  assert(!loop.pop(e, t0 + milliseconds(1000)));
}

static void test_command_join() {
  Command none = Command::join({Command::none(), Command::none()});
  assert(none.empty());

  Command single = Command::join({Command::none(), Command::quit()});
  assert(single.type == Command::Type::Quit);

  Command batch = Command::join({Command::copy("abc"),
                                 Command::after(milliseconds(5), Event::of(Event::Type::SpinnerTick))});
  assert(batch.type == Command::Type::Batch);
  assert(batch.batch.size() == 2);
  assert(contains_command(batch, Command::Type::CopyToClipboard));
  assert(contains_command(batch, Command::Type::Schedule));
  assert(!contains_command(batch, Command::Type::Quit));

  Command nested = Command::join({batch, Command::quit()});
  assert(contains_command(nested, Command::Type::CopyToClipboard));
  assert(contains_command(nested, Command::Type::Quit));
}

static void test_status_channel_success() {
  std::promise<StatusResult> p;
  auto ch = StatusChannel::create(p);
  StatusResult r;
  assert(!ch->poll(r));
  std::thread worker([&p]{ p.set_value(StatusResult::success("signed in")); });
  worker.join();
  assert(ch->poll(r));
  assert(r.ok && r.message == "signed in");
  assert(ch->consumed());
  assert(!ch->poll(r));
}

static void test_status_channel_failure_and_abandon() {
  {
    std::promise<StatusResult> p;
    auto ch = StatusChannel::create(p);
    p.set_value(StatusResult::failure("denied"));
    StatusResult r;
    assert(ch->poll(r));
    assert(!r.ok && r.error == "denied");
  }
  {
    std::shared_ptr<StatusChannel> ch;
    {
      std::promise<StatusResult> p;
      ch = StatusChannel::create(p);
    }
    StatusResult r;
    assert(ch->poll(r));
    assert(!r.ok && r.error == "operation abandoned");
  }
  {
    std::promise<StatusResult> p;
    auto ch = StatusChannel::create(p);
    p.set_exception(std::make_exception_ptr(std::runtime_error("network down")));
    StatusResult r;
    assert(ch->poll(r));
    assert(!r.ok && r.error == "network down");
  }
}

int main() {
  test_posted_before_timers();
  test_timer_ordering();
  test_next_timeout();
  test_command_join();
  test_status_channel_success();
  test_status_channel_failure_and_abandon();
  return 0;
}
