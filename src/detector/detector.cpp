#include "hotword/detector/detector.hpp"

#include "hotword/observability/global.hpp"
#include "hotword/preference/preference.hpp"

#include <algorithm>
#include <exception>
#include <type_traits>

namespace hotword::detector {

namespace {

void blocked(const std::string_view reason) {
  observability::record_start_blocked(std::string(reason));
}

} // namespace

WakeWordDetector::WakeWordDetector(config::WakeWordConfig config,
                                   const capability::CapabilityProbe &probe,
                                   engine::IRecognitionBackend &backend,
                                   scheduler::TimerQueue &timers,
                                   preference::IPreferenceStore *preferences,
                                   WakeCallback on_wake, DetectorOptions options)
    : config_(std::move(config)), probe_(probe), timers_(timers), preferences_(preferences),
      on_wake_(std::move(on_wake)),
      adapter_(backend, probe_.engine_profile(), config_.language),
      enabled_(options.enabled), dictation_active_(options.dictation_active),
      page_visible_(options.page_visible),
      rng_(options.seed.has_value() ? *options.seed : std::random_device{}()) {
  adapter_.set_listener(engine::AdapterListener{
      .on_fragment = [this](const std::string &text) { dispatch(FragmentReceived{.text = text}); },
      .on_ended = [this]() { dispatch(EngineEnded{}); },
      .on_error = [this](const engine::EngineError &error) {
        dispatch(EngineFailed{.error = error});
      }});

  if (!probe_.is_supported()) {
    state_ = DetectorState::Unsupported;
    error_ = probe_.unsupported_reason();
    return;
  }

  if (preferences_ != nullptr) {
    auto prior = preference::prior_permission_granted(*preferences_);
    if (prior.ok()) {
      prior_permission_ = prior.value();
      permission_recorded_ = prior_permission_;
    } else {
      observability::record_error("preference", prior.error());
    }
  }

  if (enabled_) {
    arm_watchdog();
    attempt_start("construction");
  }
}

WakeWordDetector::~WakeWordDetector() {
  cancel_timer(cooldown_timer_);
  cancel_timer(restart_timer_);
  cancel_timer(watchdog_timer_);
  adapter_.stop();
}

bool WakeWordDetector::restart_pending() const { return timers_.is_pending(restart_timer_); }

bool WakeWordDetector::cooldown_pending() const { return timers_.is_pending(cooldown_timer_); }

bool WakeWordDetector::watchdog_armed() const { return timers_.is_pending(watchdog_timer_); }

DetectorSnapshot WakeWordDetector::snapshot() const {
  return DetectorSnapshot{.state = state_,
                          .error = error_,
                          .has_permission = has_permission_,
                          .last_fragment = last_fragment_,
                          .is_supported = probe_.is_supported(),
                          .device = probe_.device_info(),
                          .enabled = enabled_,
                          .dictation_active = dictation_active_,
                          .page_visible = page_visible_,
                          .manually_suspended = manually_suspended_,
                          .sessions_created = adapter_.sessions_created(),
                          .wake_count = wake_count_};
}

// Events queued behind a handler that throws are dropped with it.
class WakeWordDetector::DispatchScope {
public:
  explicit DispatchScope(WakeWordDetector &detector) : detector_(detector) {
    detector_.dispatching_ = true;
  }
  ~DispatchScope() {
    detector_.dispatching_ = false;
    detector_.pending_.clear();
  }

  DispatchScope(const DispatchScope &) = delete;
  DispatchScope &operator=(const DispatchScope &) = delete;

private:
  WakeWordDetector &detector_;
};

void WakeWordDetector::dispatch(DetectorEvent event) {
  if (dispatching_) {
    pending_.push_back(std::move(event));
    return;
  }
  DispatchScope scope(*this);
  handle(event);
  while (!pending_.empty()) {
    DetectorEvent next = std::move(pending_.front());
    pending_.pop_front();
    handle(next);
  }
}

void WakeWordDetector::handle(const DetectorEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, EnableRequested>) {
          on_enable();
        } else if constexpr (std::is_same_v<T, DisableRequested>) {
          on_disable();
        } else if constexpr (std::is_same_v<T, SuspendRequested>) {
          on_suspend();
        } else if constexpr (std::is_same_v<T, ResumeRequested>) {
          on_resume();
        } else if constexpr (std::is_same_v<T, DictationActiveChanged>) {
          on_dictation_changed(evt.active);
        } else if constexpr (std::is_same_v<T, VisibilityChanged>) {
          on_visibility_changed(evt.visible);
        } else if constexpr (std::is_same_v<T, UserInteracted>) {
          on_user_interaction();
        } else if constexpr (std::is_same_v<T, SpeechOutputCompleted>) {
          on_speech_output_completed();
        } else if constexpr (std::is_same_v<T, FragmentReceived>) {
          on_fragment(evt.text);
        } else if constexpr (std::is_same_v<T, EngineEnded>) {
          on_engine_ended();
        } else if constexpr (std::is_same_v<T, EngineFailed>) {
          on_engine_failed(evt.error);
        } else if constexpr (std::is_same_v<T, CooldownElapsed>) {
          on_cooldown_elapsed();
        } else if constexpr (std::is_same_v<T, RestartDue>) {
          on_restart_due();
        } else if constexpr (std::is_same_v<T, WatchdogTick>) {
          on_watchdog_tick();
        }
      },
      event);
}

void WakeWordDetector::on_enable() {
  if (!probe_.is_supported()) {
    blocked("unsupported: " + probe_.unsupported_reason());
    return;
  }
  enabled_ = true;
  explicitly_started_ = true;
  permission_blocked_ = false;
  arm_watchdog();
  attempt_start("enable");
}

void WakeWordDetector::on_disable() {
  enabled_ = false;
  explicitly_started_ = false;
  manually_suspended_ = false;
  stop_engine();
  cancel_timer(cooldown_timer_);
  cancel_timer(restart_timer_);
  cancel_timer(watchdog_timer_);
  transition(probe_.is_supported() ? DetectorState::Idle : DetectorState::Unsupported, "disable");
}

void WakeWordDetector::on_suspend() {
  if (state_ == DetectorState::Unsupported) {
    return;
  }
  manually_suspended_ = true;
  suspend_listening("manual suspend");
}

void WakeWordDetector::on_resume() {
  if (!enabled_ || !probe_.is_supported()) {
    blocked("resume ignored: disabled");
    return;
  }
  manually_suspended_ = false;
  explicitly_started_ = true;
  attempt_start("resume");
}

void WakeWordDetector::on_dictation_changed(const bool active) {
  if (dictation_active_ == active) {
    return;
  }
  dictation_active_ = active;
  if (active) {
    if (state_ == DetectorState::Listening) {
      suspend_listening("dictation active");
    }
    return;
  }
  if (enabled_ && probe_.is_supported()) {
    attempt_start("dictation ended");
  }
}

void WakeWordDetector::on_visibility_changed(const bool visible) {
  if (page_visible_ == visible) {
    return;
  }
  page_visible_ = visible;
  if (!visible) {
    if (state_ == DetectorState::Listening || state_ == DetectorState::Cooldown ||
        state_ == DetectorState::Suspended) {
      suspend_listening("page hidden");
    } else {
      cancel_timer(restart_timer_);
    }
    return;
  }
  if (may_resume()) {
    attempt_start("page visible");
  }
}

void WakeWordDetector::on_user_interaction() {
  if (user_interacted_) {
    return;
  }
  user_interacted_ = true;
  if (enabled_) {
    attempt_start("user interaction");
  }
}

void WakeWordDetector::on_speech_output_completed() {
  if (!may_resume()) {
    return;
  }
  if (state_ == DetectorState::Cooldown) {
    cancel_timer(cooldown_timer_);
    attempt_start("speech output completed");
    if (state_ == DetectorState::Cooldown) {
      transition(DetectorState::Idle, "cooldown cancelled");
    }
    return;
  }
  if (state_ == DetectorState::Idle || state_ == DetectorState::Suspended ||
      state_ == DetectorState::Error) {
    attempt_start("speech output completed");
  }
}

void WakeWordDetector::on_fragment(const std::string &text) {
  last_fragment_ = text;
  if (state_ != DetectorState::Listening) {
    return;
  }
  const auto match = matcher::match_fragment(text, config_.phrases, config_.max_distance);
  if (match.matched) {
    handle_wake(match);
  }
}

void WakeWordDetector::on_engine_ended() {
  if (state_ != DetectorState::Listening) {
    return;
  }
  const auto &profile = adapter_.profile();
  const auto delay = profile.fixed_restart_delay.has_value() ? *profile.fixed_restart_delay
                                                             : jittered_delay();
  if (!schedule_restart(delay, "engine ended")) {
    transition(DetectorState::Idle, "engine ended");
  }
}

void WakeWordDetector::on_engine_failed(const engine::EngineError &error) {
  observability::record_event(observability::EngineErrorEvent{
      .code = error.code, .permission_denied = error.permission_denied()});
  stop_engine();
  error_ = error.message.empty() ? error.code : error.message;
  if (error.permission_denied()) {
    has_permission_ = false;
    permission_blocked_ = true;
    cancel_timer(restart_timer_);
    transition(DetectorState::Error, "permission denied");
    return;
  }
  transition(DetectorState::Error, "engine error " + error.code);
  schedule_restart(jittered_delay(), "engine error");
}

void WakeWordDetector::on_cooldown_elapsed() {
  cooldown_timer_ = scheduler::INVALID_TIMER;
  if (state_ != DetectorState::Cooldown) {
    return;
  }
  if (may_resume()) {
    attempt_start("cooldown elapsed");
  }
  if (state_ == DetectorState::Cooldown) {
    transition(DetectorState::Idle, "cooldown elapsed");
  }
}

void WakeWordDetector::on_restart_due() {
  restart_timer_ = scheduler::INVALID_TIMER;
  if (may_resume()) {
    attempt_start("restart");
  }
  if (state_ == DetectorState::Listening && !adapter_.active()) {
    transition(DetectorState::Idle, "restart blocked");
  }
}

void WakeWordDetector::on_watchdog_tick() {
  if (!enabled_ || !probe_.is_supported()) {
    return;
  }
  if (dictation_active_ || manually_suspended_ || !page_visible_) {
    return;
  }
  // Cooldown finishes on its own timer.
  if (state_ == DetectorState::Listening || state_ == DetectorState::Cooldown) {
    return;
  }
  observability::record_event(
      observability::WatchdogRestartEvent{.state = std::string(to_string(state_))});
  attempt_start("watchdog");
}

bool WakeWordDetector::may_resume() const {
  return enabled_ && !dictation_active_ && !manually_suspended_;
}

bool WakeWordDetector::attempt_start(const std::string_view trigger) {
  if (!probe_.is_supported()) {
    blocked("unsupported");
    return false;
  }
  if (!enabled_) {
    blocked("disabled");
    return false;
  }
  if (!config_.auto_start && !explicitly_started_) {
    blocked("auto start off");
    return false;
  }
  if (permission_blocked_) {
    blocked("permission denied");
    return false;
  }
  if (dictation_active_) {
    blocked("dictation active");
    return false;
  }
  if (manually_suspended_) {
    blocked("manually suspended");
    return false;
  }
  if (config_.require_user_interaction && !user_interacted_) {
    // Earlier successful start stands in for the interaction.
    if (!prior_permission_) {
      blocked("waiting for user interaction");
      return false;
    }
  }
  if (!page_visible_) {
    blocked("page hidden");
    return false;
  }
  if (timers_.is_pending(cooldown_timer_)) {
    blocked("cooldown pending");
    return false;
  }
  if (state_ == DetectorState::Listening && adapter_.active()) {
    return true;
  }

  cancel_timer(restart_timer_);
  auto status = adapter_.start();
  if (!status.ok()) {
    error_ = status.error();
    observability::record_error("engine", status.error());
    transition(DetectorState::Error, "start failed");
    return false;
  }

  error_.reset();
  has_permission_ = true;
  remember_permission();
  transition(DetectorState::Listening, trigger);
  return true;
}

void WakeWordDetector::stop_engine() { adapter_.stop(); }

void WakeWordDetector::suspend_listening(const std::string_view reason) {
  stop_engine();
  cancel_timer(cooldown_timer_);
  cancel_timer(restart_timer_);
  transition(DetectorState::Suspended, reason);
}

void WakeWordDetector::handle_wake(const matcher::MatchResult &match) {
  const auto now = timers_.clock().now();
  if (last_trigger_.has_value() && now - *last_trigger_ < config_.min_interval) {
    observability::record_event(observability::WakeSuppressedEvent{.reason = "min interval"});
    return;
  }
  last_trigger_ = now;
  ++wake_count_;
  observability::record_event(
      observability::WakeTriggeredEvent{.phrase = match.phrase.value_or(""),
                                        .fragment = last_fragment_,
                                        .distance = match.distance.value_or(0)});
  observability::record_metric(observability::WakeTriggersMetric{.count = wake_count_});

  invoke_wake_callback();
  stop_engine();
  enter_cooldown();
}

void WakeWordDetector::invoke_wake_callback() {
  if (!on_wake_) {
    return;
  }
  try {
    on_wake_();
  } catch (const std::exception &e) {
    observability::record_error("detector", std::string("wake callback threw: ") + e.what());
  } catch (...) {
    observability::record_error("detector", "wake callback threw a non-standard exception");
  }
}

void WakeWordDetector::enter_cooldown() {
  cancel_timer(restart_timer_);
  cancel_timer(cooldown_timer_);
  transition(DetectorState::Cooldown, "wake");
  cooldown_timer_ =
      timers_.schedule_after(config_.cooldown, [this]() { dispatch(CooldownElapsed{}); });
}

bool WakeWordDetector::schedule_restart(const std::chrono::milliseconds delay,
                                        const std::string_view reason) {
  if (timers_.is_pending(restart_timer_)) {
    return true;
  }
  if (!may_resume() || permission_blocked_) {
    return false;
  }
  restart_timer_ = timers_.schedule_after(delay, [this]() { dispatch(RestartDue{}); });
  observability::record_event(
      observability::RestartScheduledEvent{.delay = delay, .reason = std::string(reason)});
  return true;
}

std::chrono::milliseconds WakeWordDetector::jittered_delay() {
  const auto low = config_.restart_delay_min.count();
  const auto high = std::max(config_.restart_delay_min, config_.restart_delay_max).count();
  std::uniform_int_distribution<long long> dist(low, high);
  return std::chrono::milliseconds(dist(rng_));
}

void WakeWordDetector::arm_watchdog() {
  if (config_.watchdog_interval.count() <= 0 || timers_.is_pending(watchdog_timer_)) {
    return;
  }
  watchdog_timer_ = timers_.schedule_every(config_.watchdog_interval,
                                           [this]() { dispatch(WatchdogTick{}); });
}

void WakeWordDetector::cancel_timer(scheduler::TimerId &id) {
  timers_.cancel(id);
  id = scheduler::INVALID_TIMER;
}

void WakeWordDetector::transition(const DetectorState to, const std::string_view reason) {
  if (to == state_) {
    return;
  }
  observability::record_transition(std::string(to_string(state_)), std::string(to_string(to)),
                                   std::string(reason));
  state_ = to;
}

void WakeWordDetector::remember_permission() {
  if (permission_recorded_ || preferences_ == nullptr) {
    return;
  }
  auto status = preference::record_permission_granted(*preferences_);
  if (!status.ok()) {
    observability::record_error("preference", status.error());
    return;
  }
  permission_recorded_ = true;
}

} // namespace hotword::detector
