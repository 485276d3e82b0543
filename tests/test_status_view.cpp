#include "status_view.hpp"
#include "keybindings.hpp"
#include <cassert>
#include <chrono>
#include <future>
#include <string>

using namespace std::chrono;

static const char* DATA = R"(
title: Sign in to Entra
message:
  - Open the page below and enter the code.
code: ABCD-1234
url: https://microsoft.com/devicelogin
)";

static StatusDisplay base_config() {
  StatusDisplay cfg;
  cfg.title_field = "title";
  cfg.message_field = "message";
  cfg.wait_message = "Waiting for authentication";
  cfg.display_fields = {{"Code", "code"}, {"URL", "url"}, {"Missing", "nope"}};
  StatusAction copy;
  copy.label = "copy code";
  copy.type = ActionType::CopyValue;
  copy.field = "code";
  copy.keys = {"c", "alt+c", "f2"};
  StatusAction open;
  open.label = "open";
  open.type = ActionType::OpenUrl;
  open.field = "url";
  open.keys = {"o", "alt+o", "f3"};
  StatusAction broken;
  broken.label = "token";
  broken.type = ActionType::CopyValue;
  broken.field = "token";
  broken.keys = {"t", "alt+t", "f4"};
  cfg.actions = {copy, open, broken};
  cfg.done_delay = milliseconds(1500);
  return cfg;
}

static Event key(int k) { return Event::key_press(k); }

static void test_waiting_render_and_footer() {
  StatusView v(YAML::Load(DATA), base_config(), KeyMode::Vim);
  assert(v.title() == "Sign in to Entra");
  assert(v.phase() == StatusPhase::Waiting);
  assert(v.messages().size() == 1);
  std::string text = frame_text(v.render(80, 20, false));
  assert(text.find("Open the page below") != std::string::npos);
  assert(text.find("Code: ABCD-1234") != std::string::npos);
  assert(text.find("Missing") == std::string::npos);
  assert(text.find("Waiting for authentication") != std::string::npos);
  assert(v.footer() == "c copy code o open t token q quit");

  StatusView emacs(YAML::Load(DATA), base_config(), KeyMode::Emacs);
  assert(emacs.footer() == "M-c copy code M-o open M-t token C-q quit");
  StatusView fkeys(YAML::Load(DATA), base_config(), KeyMode::Function);
  assert(fkeys.footer() == "F2 copy code F3 open F4 token F10 quit");
}

static void test_spinner_ticks_only_while_waiting() {
  StatusView v(YAML::Load(DATA), base_config(), KeyMode::Vim);
  Command init = v.init();
  assert(init.type == Command::Type::Schedule);
  assert(init.event.type == Event::Type::SpinnerTick);
  Command next = v.update(Event::of(Event::Type::SpinnerTick));
  assert(next.type == Command::Type::Schedule);
  assert(v.spinner_frame() == 1);
  v.update(Event::done(StatusResult::success()));
  assert(v.update(Event::of(Event::Type::SpinnerTick)).empty());
}

static void test_success_then_exit_after_delay() {
  StatusDisplay cfg = base_config();
  cfg.success_message = "Signed in";
  StatusView v(YAML::Load(DATA), cfg, KeyMode::Vim);
  Command c = v.update(Event::done(StatusResult::success()));
  assert(v.phase() == StatusPhase::Success);
  assert(v.result_message() == "Signed in");
  assert(c.type == Command::Type::Schedule);
  assert(c.delay == milliseconds(1500));
  assert(c.event.type == Event::Type::DoneTimer);
  assert(frame_text(v.render(80, 20, false)).find("✓ Signed in") != std::string::npos);

  // completion is terminal
  v.update(Event::done(StatusResult::failure("late")));
  assert(v.phase() == StatusPhase::Success);
  assert(v.update(Event::of(Event::Type::DoneTimer)).type == Command::Type::Quit);
}

static void test_result_message_precedence() {
  StatusView v(YAML::Load(DATA), base_config(), KeyMode::Vim);
  v.update(Event::done(StatusResult::success("Authenticated as ada")));
  assert(v.result_message() == "Authenticated as ada");

  StatusView d(YAML::Load(DATA), base_config(), KeyMode::Vim);
  d.update(Event::done(StatusResult::success()));
  assert(d.result_message() == "Done");
}

static void test_error_wait_for_key() {
  StatusDisplay cfg = base_config();
  cfg.done_behavior = DoneBehavior::WaitForKey;
  StatusView v(YAML::Load(DATA), cfg, KeyMode::Vim);
  assert(v.update(Event::of(Event::Type::DoneTimer)).empty());
  Command c = v.update(Event::done(StatusResult::failure("access denied")));
  assert(c.empty());
  assert(v.phase() == StatusPhase::Error);
  std::string text = frame_text(v.render(80, 20, false));
  assert(text.find("✗ access denied") != std::string::npos);
  assert(text.find("Press any key to exit") != std::string::npos);
  assert(v.update(key('x')).type == Command::Type::Quit);
}

static void test_timeout_without_channel() {
  StatusDisplay cfg = base_config();
  cfg.timeout = seconds(3);
  StatusView v(YAML::Load(DATA), cfg, KeyMode::Vim);
  Command init = v.init();
  assert(init.type == Command::Type::Batch);
  assert(init.batch.size() == 2);
  assert(init.batch[1].delay == seconds(3));
  assert(init.batch[1].event.type == Event::Type::StatusTimeout);
  v.update(Event::of(Event::Type::StatusTimeout));
  assert(v.phase() == StatusPhase::Success);

  // a channel takes precedence over the timeout
  std::promise<StatusResult> p;
  StatusView withch(YAML::Load(DATA), cfg, KeyMode::Vim, StatusChannel::create(p));
  assert(withch.init().type == Command::Type::Schedule);
  p.set_value(StatusResult::success());
}

static void test_poll_channel() {
  std::promise<StatusResult> p;
  StatusView v(YAML::Load(DATA), base_config(), KeyMode::Vim, StatusChannel::create(p));
  assert(v.has_channel());
  Event e;
  assert(!v.poll(e));
  p.set_value(StatusResult::failure("expired"));
  assert(v.poll(e));
  assert(e.type == Event::Type::StatusDone);
  v.update(e);
  assert(v.phase() == StatusPhase::Error);
  assert(!v.poll(e));
}

static void test_actions_and_flash() {
  StatusView v(YAML::Load(DATA), base_config(), KeyMode::Vim);
  Command c = v.update(key('c'));
  assert(c.type == Command::Type::Batch);
  assert(c.batch[0].type == Command::Type::CopyToClipboard);
  assert(c.batch[0].payload == "ABCD-1234");
  assert(c.batch[1].type == Command::Type::Schedule);
  assert(c.batch[1].event.type == Event::Type::FlashClear);
  assert(v.flash().text == "✓ Copied to clipboard");
  assert(!v.flash().is_error);
  uint64_t first = v.flash_generation();

  Command o = v.update(key('o'));
  assert(contains_command(o, Command::Type::OpenUrl));
  assert(o.batch[0].payload == "https://microsoft.com/devicelogin");
  assert(v.flash().text == "✓ Opened in browser");

  // an older clear does not erase the newer flash
  v.update(Event::flash_clear(first));
  assert(v.flash().text == "✓ Opened in browser");
  v.update(Event::flash_clear(v.flash_generation()));
  assert(v.flash().text.empty());

  Command t = v.update(key('t'));
  assert(t.type == Command::Type::Schedule);
  assert(v.flash().is_error);
  assert(v.flash().text.find("field \"token\" not found") != std::string::npos);

  // emacs bindings use the emacs keys
  StatusView e(YAML::Load(DATA), base_config(), KeyMode::Emacs);
  assert(e.update(key('c')).empty());
  assert(contains_command(e.update(key(ALT_BIT | 'c')), Command::Type::CopyToClipboard));
}

static void test_failed_effect_flash() {
  StatusView v(YAML::Load(DATA), base_config(), KeyMode::Vim);
  Command c = v.update(key('c'));
  uint64_t optimistic = v.flash_generation();
  Command f = v.effect_failed("clipboard unavailable");
  assert(f.type == Command::Type::Schedule);
  assert(f.event.flash_id == v.flash_generation());
  assert(v.flash_generation() == optimistic + 1);
  assert(v.flash().text == "⚠ copy code: clipboard unavailable");
  assert(v.flash().is_error);

  // the clear queued with the optimistic flash leaves the failure up
  v.update(c.batch[1].event);
  assert(v.flash().is_error);
  v.update(f.event);
  assert(v.flash().text.empty());

  v.update(key('c'));
  assert(v.flash().text == "✓ Copied to clipboard");
  assert(!v.flash().is_error);
}

static void test_flash_duration() {
  StatusView v(YAML::Load(DATA), base_config(), KeyMode::Vim);
  v.set_flash_duration(milliseconds(250));
  Command c = v.update(key('c'));
  assert(c.batch[1].delay == milliseconds(250));
}

static void test_quit_keys() {
  StatusView v(YAML::Load(DATA), base_config(), KeyMode::Vim);
  assert(v.update(key('q')).type == Command::Type::Quit);
  assert(v.update(key(CTRL_c)).type == Command::Type::Quit);
  assert(v.update(key(ESC)).type == Command::Type::Quit);
  assert(v.update(key('x')).empty());
  StatusView f(YAML::Load(DATA), base_config(), KeyMode::Function);
  assert(f.update(key('q')).empty());
}

int main() {
  test_waiting_render_and_footer();
  test_spinner_ticks_only_while_waiting();
  test_success_then_exit_after_delay();
  test_result_message_precedence();
  test_error_wait_for_key();
  test_timeout_without_channel();
  test_poll_channel();
  test_actions_and_flash();
  test_failed_effect_flash();
  test_flash_duration();
  test_quit_keys();
  return 0;
}
