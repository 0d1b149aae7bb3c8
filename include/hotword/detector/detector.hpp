#pragma once

#include "hotword/capability/probe.hpp"
#include "hotword/config/schema.hpp"
#include "hotword/detector/events.hpp"
#include "hotword/detector/state.hpp"
#include "hotword/engine/adapter.hpp"
#include "hotword/matcher/phrase_matcher.hpp"
#include "hotword/preference/store.hpp"
#include "hotword/scheduler/timer_queue.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace hotword::detector {

struct DetectorOptions {
  bool enabled = false;
  bool dictation_active = false;
  bool page_visible = true;
  // Fixes the restart jitter sequence.
  std::optional<std::uint32_t> seed;
};

struct DetectorSnapshot {
  DetectorState state = DetectorState::Idle;
  std::optional<std::string> error;
  std::optional<bool> has_permission;
  std::string last_fragment;
  bool is_supported = false;
  capability::DeviceInfo device;
  bool enabled = false;
  bool dictation_active = false;
  bool page_visible = true;
  bool manually_suspended = false;
  std::uint64_t sessions_created = 0;
  std::uint64_t wake_count = 0;
};

/// Passive wake-phrase listener. Owns the detector state and decides when the
/// recognition engine runs. Every signal becomes a DetectorEvent handled by
/// dispatch(); events raised while a dispatch is in progress (from the wake
/// callback or an engine callback) are queued and handled once the current
/// transition has completed. Single-threaded: all calls, engine callbacks and
/// timer tasks must come from the thread that runs the TimerQueue.
class WakeWordDetector {
public:
  using WakeCallback = std::function<void()>;

  WakeWordDetector(config::WakeWordConfig config, const capability::CapabilityProbe &probe,
                   engine::IRecognitionBackend &backend, scheduler::TimerQueue &timers,
                   preference::IPreferenceStore *preferences, WakeCallback on_wake,
                   DetectorOptions options = {});
  ~WakeWordDetector();

  WakeWordDetector(const WakeWordDetector &) = delete;
  WakeWordDetector &operator=(const WakeWordDetector &) = delete;

  void enable() { dispatch(EnableRequested{}); }
  void disable() { dispatch(DisableRequested{}); }
  void suspend() { dispatch(SuspendRequested{}); }
  void resume() { dispatch(ResumeRequested{}); }
  void set_dictation_active(bool active) { dispatch(DictationActiveChanged{.active = active}); }
  void set_page_visible(bool visible) { dispatch(VisibilityChanged{.visible = visible}); }
  void notify_user_interaction() { dispatch(UserInteracted{}); }
  void notify_speech_output_completed() { dispatch(SpeechOutputCompleted{}); }

  void dispatch(DetectorEvent event);

  [[nodiscard]] DetectorSnapshot snapshot() const;
  [[nodiscard]] DetectorState state() const { return state_; }
  [[nodiscard]] const std::optional<std::string> &error() const { return error_; }
  [[nodiscard]] std::optional<bool> has_permission() const { return has_permission_; }
  [[nodiscard]] const std::string &last_fragment() const { return last_fragment_; }
  [[nodiscard]] bool is_supported() const { return probe_.is_supported(); }
  [[nodiscard]] const capability::DeviceInfo &device_info() const { return probe_.device_info(); }
  [[nodiscard]] const config::WakeWordConfig &config() const { return config_; }
  [[nodiscard]] bool restart_pending() const;
  [[nodiscard]] bool cooldown_pending() const;
  [[nodiscard]] bool watchdog_armed() const;

private:
  class DispatchScope;

  void handle(const DetectorEvent &event);

  void on_enable();
  void on_disable();
  void on_suspend();
  void on_resume();
  void on_dictation_changed(bool active);
  void on_visibility_changed(bool visible);
  void on_user_interaction();
  void on_speech_output_completed();
  void on_fragment(const std::string &text);
  void on_engine_ended();
  void on_engine_failed(const engine::EngineError &error);
  void on_cooldown_elapsed();
  void on_restart_due();
  void on_watchdog_tick();

  // Runs every start gate; a failed gate is a silent no-op.
  bool attempt_start(std::string_view trigger);
  [[nodiscard]] bool may_resume() const;
  void stop_engine();
  void suspend_listening(std::string_view reason);
  void handle_wake(const matcher::MatchResult &match);
  void invoke_wake_callback();
  void enter_cooldown();
  bool schedule_restart(std::chrono::milliseconds delay, std::string_view reason);
  [[nodiscard]] std::chrono::milliseconds jittered_delay();
  void arm_watchdog();
  void cancel_timer(scheduler::TimerId &id);
  void transition(DetectorState to, std::string_view reason);
  void remember_permission();

  config::WakeWordConfig config_;
  capability::CapabilityProbe probe_;
  scheduler::TimerQueue &timers_;
  preference::IPreferenceStore *preferences_ = nullptr;
  WakeCallback on_wake_;
  engine::EngineAdapter adapter_;

  DetectorState state_ = DetectorState::Idle;
  std::optional<std::string> error_;
  std::optional<bool> has_permission_;
  std::string last_fragment_;
  std::optional<scheduler::TimePoint> last_trigger_;
  std::uint64_t wake_count_ = 0;

  bool enabled_ = false;
  bool dictation_active_ = false;
  bool page_visible_ = true;
  bool manually_suspended_ = false;
  bool user_interacted_ = false;
  bool explicitly_started_ = false;
  bool permission_blocked_ = false;
  // Read once at construction. Trusted without re-checking the platform.
  bool prior_permission_ = false;
  bool permission_recorded_ = false;

  scheduler::TimerId cooldown_timer_ = scheduler::INVALID_TIMER;
  scheduler::TimerId restart_timer_ = scheduler::INVALID_TIMER;
  scheduler::TimerId watchdog_timer_ = scheduler::INVALID_TIMER;

  std::mt19937 rng_;
  bool dispatching_ = false;
  std::deque<DetectorEvent> pending_;
};

} // namespace hotword::detector
