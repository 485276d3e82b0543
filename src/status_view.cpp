#include "status_view.hpp"
#include "config.hpp"
#include "data_tree.hpp"
#include "keybindings.hpp"
#include "text_util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

static const char* const SPINNER[] = {"⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏"};
static constexpr int SPINNER_FRAMES = sizeof(SPINNER) / sizeof(SPINNER[0]);

const char* status_phase_name(StatusPhase p) {
  switch (p) {
    case StatusPhase::Success: return "success";
    case StatusPhase::Error: return "error";
    case StatusPhase::Waiting: break;
  }
  return "waiting";
}

StatusView::StatusView(const YAML::Node& data, const StatusDisplay& cfg, KeyMode mode,
                       std::shared_ptr<StatusChannel> channel)
  : cfg_(cfg), mode_(mode), channel_(std::move(channel)) {
  data_.reset(data);
}

std::string StatusView::title() const {
  return field_text(data_, cfg_.title_field);
}

std::vector<std::string> StatusView::messages() const {
  std::vector<std::string> out;
  YAML::Node v;
  if (!field_value(data_, cfg_.message_field, v) || v.IsNull()) return out;
  if (v.IsSequence()) {
    for (const auto& m : v) out.push_back(scalar_text(m));
  } else {
    out.push_back(scalar_text(v));
  }
  return out;
}

std::string StatusView::action_key(const StatusAction& a) const {
  switch (mode_) {
    case KeyMode::Emacs: return a.keys.emacs;
    case KeyMode::Function: return a.keys.function;
    case KeyMode::Vim: break;
  }
  return a.keys.vim;
}

std::string StatusView::footer() const {
  std::string out;
  for (const auto& a : cfg_.actions) {
    std::string k = action_key(a);
    if (k.empty() || a.label.empty()) continue;
    out += display_key(k, mode_) + " " + a.label + " ";
  }
  return out + quit_key(mode_) + " quit";
}

Command StatusView::init() {
  std::vector<Command> cmds;
  cmds.push_back(Command::after(std::chrono::milliseconds(KVVIEW_SPINNER_INTERVAL_MS), Event::of(Event::Type::SpinnerTick)));
  if (!channel_ && cfg_.timeout) cmds.push_back(Command::after(*cfg_.timeout, Event::of(Event::Type::StatusTimeout)));
  return Command::join(std::move(cmds));
}

bool StatusView::poll(Event& out) {
  if (!channel_ || phase_ != StatusPhase::Waiting) return false;
  StatusResult r;
  if (!channel_->poll(r)) return false;
  out = Event::done(std::move(r));
  return true;
}

Flash StatusView::flash() const {
  if (flash_.empty()) return Flash{};
  return Flash{flash_, flash_.rfind("⚠", 0) == 0};
}

Command StatusView::finish(StatusPhase p, std::string msg) {
  phase_ = p;
  result_ = std::move(msg);
  spdlog::debug("status -> {}: {}", status_phase_name(p), result_);
  if (cfg_.done_behavior == DoneBehavior::WaitForKey) return Command::none();
  return Command::after(cfg_.done_delay, Event::of(Event::Type::DoneTimer));
}

Command StatusView::update(const Event& e) {
  switch (e.type) {
    case Event::Type::SpinnerTick:
      if (phase_ != StatusPhase::Waiting) return Command::none();
      spinner_frame_ = (spinner_frame_ + 1) % SPINNER_FRAMES;
      return Command::after(std::chrono::milliseconds(KVVIEW_SPINNER_INTERVAL_MS), Event::of(Event::Type::SpinnerTick));
    case Event::Type::StatusDone:
      if (phase_ != StatusPhase::Waiting) return Command::none();
      if (!e.result.ok) return finish(StatusPhase::Error, e.result.error.empty() ? std::string("failed") : e.result.error);
      if (!e.result.message.empty()) return finish(StatusPhase::Success, e.result.message);
      return finish(StatusPhase::Success, cfg_.success_message.empty() ? std::string("Done") : cfg_.success_message);
    case Event::Type::StatusTimeout:
      if (phase_ != StatusPhase::Waiting) return Command::none();
      return finish(StatusPhase::Success, cfg_.success_message.empty() ? std::string("Done") : cfg_.success_message);
    case Event::Type::DoneTimer:
      if (phase_ == StatusPhase::Waiting) return Command::none();
      return Command::quit();
    case Event::Type::FlashClear:
      if (e.flash_id == flash_gen_) flash_.clear();
      return Command::none();
    case Event::Type::Key:
      return handle_key(e.key);
  }
  return Command::none();
}

Command StatusView::handle_key(int key) {
  std::string k = key_name(key);
  if (k == "ctrl+c" || k == "esc") return Command::quit();
  if (phase_ != StatusPhase::Waiting && cfg_.done_behavior == DoneBehavior::WaitForKey) return Command::quit();
  if (key_matches(key, binding_for(Action::Quit, mode_))) return Command::quit();
  for (const auto& a : cfg_.actions) {
    if (key_matches(key, action_key(a))) return run_action(a);
  }
  return Command::none();
}

Command StatusView::set_flash(std::string text) {
  flash_ = std::move(text);
  flash_gen_++;
  return Command::after(flash_duration_, Event::flash_clear(flash_gen_));
}

Command StatusView::effect_failed(const std::string& err) {
  return set_flash("⚠ " + last_action_ + ": " + err);
}

Command StatusView::run_action(const StatusAction& a) {
  last_action_ = a.label;
  std::string value = field_text(data_, a.field);
  if (value.empty()) return set_flash("⚠ " + a.label + ": field \"" + a.field + "\" not found");
  switch (a.type) {
    case ActionType::CopyValue:
      return Command::join({Command::copy(value), set_flash("✓ Copied to clipboard")});
    case ActionType::OpenUrl:
      return Command::join({Command::open_url(value), set_flash("✓ Opened in browser")});
  }
  return Command::none();
}

Frame StatusView::render(int width, int /*height*/, bool color) {
  Frame out;
  int w = std::max(10, width - 4);
  auto msgs = messages();
  for (const auto& m : msgs) {
    for (const auto& l : wrap_words(m, w)) out.push_back(plain("  " + l, color ? Style::Accent : Style::Normal));
  }
  if (!msgs.empty()) out.push_back(Line{});

  bool any_field = false;
  for (const auto& f : cfg_.display_fields) {
    std::string v = field_text(data_, f.field);
    if (v.empty()) continue;
    any_field = true;
    out.push_back(Line{Span{"  ", Style::Normal}, Span{f.label + ":", color ? Style::Title : Style::Normal},
                       Span{" " + v, Style::Normal}});
  }
  if (any_field) out.push_back(Line{});

  switch (phase_) {
    case StatusPhase::Waiting:
      if (!cfg_.wait_message.empty()) {
        out.push_back(Line{Span{"  " + std::string(SPINNER[spinner_frame_]) + " ", color ? Style::Accent : Style::Normal},
                           Span{cfg_.wait_message, Style::Normal}});
        out.push_back(Line{});
      }
      break;
    case StatusPhase::Success:
      out.push_back(plain("  ✓ " + result_, color ? Style::Success : Style::Normal));
      out.push_back(Line{});
      break;
    case StatusPhase::Error:
      out.push_back(plain("  ✗ " + result_, color ? Style::Error : Style::Normal));
      out.push_back(Line{});
      break;
  }
  if (phase_ != StatusPhase::Waiting && cfg_.done_behavior == DoneBehavior::WaitForKey) {
    out.push_back(plain("  Press any key to exit"));
    out.push_back(Line{});
  }
  return out;
}
