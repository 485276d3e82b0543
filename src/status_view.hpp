#pragma once
/*
 * StatusView
 *
 * Purpose: track an external async operation (login poll, deployment) as
 *          Waiting -> Success | Error and render it as a status screen.
 * Inputs: completion arrives once through a StatusChannel polled by the host;
 *         without a channel an optional schema timeout ends the wait instead.
 * Flash: each flash gets a fresh generation id; a FlashClear carrying an
 *        older id is ignored, so a late clear never erases a newer flash.
 * Note: mutated only on the UI thread.
 */
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>
#include "custom_view.hpp"
#include "display_schema.hpp"
#include "event_loop.hpp"
#include "config.hpp"
#include "types.hpp"

enum class StatusPhase { Waiting, Success, Error };

const char* status_phase_name(StatusPhase p);

class StatusView {
public:
  StatusView(const YAML::Node& data, const StatusDisplay& cfg, KeyMode mode,
             std::shared_ptr<StatusChannel> channel = nullptr);

  std::string title() const;
  std::string footer() const;
  Command init();
  Flash flash() const;
  Frame render(int width, int height, bool color);
  Position position() const { return Position{1, 1, "status"}; }
  Command update(const Event& e);

  // non-blocking; yields the StatusDone event once the channel fires
  bool poll(Event& out);

  StatusPhase phase() const { return phase_; }
  const std::string& result_message() const { return result_; }
  uint64_t flash_generation() const { return flash_gen_; }
  int spinner_frame() const { return spinner_frame_; }
  std::vector<std::string> messages() const;
  bool has_channel() const { return channel_ != nullptr; }
  void set_flash_duration(std::chrono::milliseconds d) { flash_duration_ = d; }
  // replaces the optimistic flash of the last action with "⚠ label: err"
  Command effect_failed(const std::string& err);

private:
  Command finish(StatusPhase p, std::string msg);
  Command handle_key(int key);
  Command run_action(const StatusAction& a);
  Command set_flash(std::string text);
  std::string action_key(const StatusAction& a) const;

  YAML::Node data_;
  StatusDisplay cfg_;
  KeyMode mode_;
  std::shared_ptr<StatusChannel> channel_;
  StatusPhase phase_ = StatusPhase::Waiting;
  std::string result_;
  std::string flash_;
  std::string last_action_;
  uint64_t flash_gen_ = 0;
  std::chrono::milliseconds flash_duration_{KVVIEW_FLASH_MS};
  int spinner_frame_ = 0;
};
