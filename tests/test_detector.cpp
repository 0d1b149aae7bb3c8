#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "hotword/detector/detector.hpp"
#include "hotword/observability/global.hpp"
#include "hotword/preference/preference.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using hotword::detector::DetectorOptions;
using hotword::detector::DetectorState;
using hotword::testing::DetectorHarness;
using std::chrono::milliseconds;

std::string state_name(DetectorState state) { return std::string(hotword::detector::to_string(state)); }

void require_state(DetectorHarness &harness, DetectorState expected, const std::string &context) {
  hotword::tests::require(harness.detector().state() == expected,
                          context + ": expected " + state_name(expected) + ", got " +
                              state_name(harness.detector().state()));
}

class ThrowOnTransitionObserver final : public hotword::observability::IObserver {
public:
  void record_event(const hotword::observability::ObserverEvent &event) override {
    if (std::holds_alternative<hotword::observability::StateTransitionEvent>(event)) {
      throw std::runtime_error("observer failure");
    }
  }
  void record_metric(const hotword::observability::ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "throwing"; }
};

} // namespace

void register_detector_tests(std::vector<hotword::tests::TestCase> &tests) {
  using hotword::tests::require;
  namespace ht = hotword::testing;
  namespace obs = hotword::observability;
  namespace pref = hotword::preference;

  tests.push_back({"detector_stays_idle_when_disabled", [] {
                     DetectorHarness harness;
                     harness.create(DetectorOptions{});
                     require_state(harness, DetectorState::Idle, "disabled");
                     require(harness.backend().sessions_created() == 0, "no session");
                     require(!harness.detector().watchdog_armed(), "no watchdog while disabled");
                     harness.advance(milliseconds(30000));
                     require_state(harness, DetectorState::Idle, "after a long wait");
                   }});

  tests.push_back({"detector_auto_starts_and_remembers_permission", [] {
                     DetectorHarness harness;
                     harness.create_enabled();
                     require_state(harness, DetectorState::Listening, "enabled at construction");
                     require(harness.detector().has_permission().value_or(false),
                             "permission observed");
                     require(!harness.detector().error().has_value(), "no error");
                     require(harness.detector().watchdog_armed(), "watchdog armed");
                     const auto stored =
                         harness.store().get(std::string(pref::PERMISSION_GRANTED_KEY));
                     require(stored.ok() && stored.value().value_or("") == "true",
                             "permission flag persisted");
                     const auto settings = harness.backend().last_settings();
                     require(settings.has_value() && settings->continuous &&
                                 settings->language == "en-US",
                             "continuous session in the configured language");
                   }});

  tests.push_back({"detector_unsupported_platform_never_leaves_unsupported", [] {
                     DetectorHarness harness(ht::test_wake_config(), ht::ANDROID_CHROME_UA);
                     auto &detector = harness.create_enabled();
                     require_state(harness, DetectorState::Unsupported, "construction");
                     require(detector.error().has_value(), "reason exposed as error");
                     require(!detector.is_supported(), "unsupported");
                     detector.enable();
                     detector.resume();
                     detector.notify_speech_output_completed();
                     harness.advance(milliseconds(20000));
                     require_state(harness, DetectorState::Unsupported, "after enable");
                     detector.disable();
                     require_state(harness, DetectorState::Unsupported, "after disable");
                     require(harness.backend().sessions_created() == 0, "engine never touched");
                   }});

  tests.push_back({"detector_missing_recognition_is_unsupported", [] {
                     DetectorHarness harness(ht::test_wake_config(), ht::DESKTOP_FIREFOX_UA, false);
                     harness.create_enabled();
                     require_state(harness, DetectorState::Unsupported, "no primitive");
                   }});

  tests.push_back({"detector_waits_for_user_interaction", [] {
                     auto config = ht::test_wake_config();
                     config.require_user_interaction = true;
                     DetectorHarness harness(config);
                     auto &detector = harness.create_enabled();
                     require_state(harness, DetectorState::Idle, "gated");
                     harness.advance(milliseconds(7000));
                     require_state(harness, DetectorState::Idle, "watchdog respects the gate");
                     detector.notify_user_interaction();
                     require_state(harness, DetectorState::Listening, "after interaction");
                   }});

  tests.push_back({"detector_prior_permission_skips_interaction_gate", [] {
                     auto config = ht::test_wake_config();
                     config.require_user_interaction = true;
                     DetectorHarness harness(config);
                     require(pref::record_permission_granted(harness.store()).ok(), "seed flag");
                     harness.create_enabled();
                     require_state(harness, DetectorState::Listening, "prior grant");
                   }});

  tests.push_back({"detector_enable_while_listening_is_noop", [] {
                     DetectorHarness harness;
                     auto &detector = harness.create_enabled();
                     detector.enable();
                     detector.resume();
                     require(harness.backend().sessions_created() == 1, "still one session");
                     require(harness.backend().stops() == 0, "not restarted");
                   }});

  tests.push_back({"detector_wake_phrase_triggers_cooldown", [] {
                     const ht::ObserverCapture capture;
                     DetectorHarness harness;
                     auto &detector = harness.create_enabled();
                     require(harness.backend().emit_result("could you please hey jac", false),
                             "fragment delivered");
                     require(harness.wakes() == 1, "callback invoked once");
                     require_state(harness, DetectorState::Cooldown, "after wake");
                     require(harness.backend().stops() == 1, "engine stopped once");
                     require(detector.last_fragment() == "could you please hey jac",
                             "last fragment kept");
                     require(detector.snapshot().wake_count == 1, "wake counted");

                     const auto wakes = capture.events_of<obs::WakeTriggeredEvent>();
                     require(wakes.size() == 1 && wakes[0].phrase == "hey jacq" &&
                                 wakes[0].distance == 1,
                             "wake event recorded");
                   }});

  tests.push_back({"detector_non_matching_fragment_keeps_listening", [] {
                     DetectorHarness harness;
                     auto &detector = harness.create_enabled();
                     require(harness.backend().emit_result("what is the weather"), "fragment");
                     require(harness.wakes() == 0, "no wake");
                     require_state(harness, DetectorState::Listening, "still listening");
                     require(detector.last_fragment() == "what is the weather", "fragment kept");
                   }});

  tests.push_back({"detector_cooldown_blocks_until_elapsed", [] {
                     DetectorHarness harness;
                     harness.create_enabled();
                     require(harness.backend().emit_result("hey jacq"), "wake");
                     harness.advance(milliseconds(3999));
                     require_state(harness, DetectorState::Cooldown, "at 3999ms");
                     require(!harness.backend().emit_result("hey jacq"),
                             "no session during cooldown");
                     harness.detector().enable();
                     require_state(harness, DetectorState::Cooldown, "enable respects cooldown");
                     harness.advance(milliseconds(1));
                     require_state(harness, DetectorState::Listening, "at 4000ms");
                     require(harness.backend().sessions_created() == 2, "fresh session");
                   }});

  tests.push_back({"detector_min_interval_suppresses_rapid_wakes", [] {
                     const ht::ObserverCapture capture;
                     auto config = ht::test_wake_config();
                     config.cooldown = milliseconds(500);
                     config.min_interval = milliseconds(2500);
                     DetectorHarness harness(config);
                     harness.create_enabled();

                     require(harness.backend().emit_result("hey jacq"), "first wake");
                     harness.advance(milliseconds(1000));
                     require_state(harness, DetectorState::Listening, "listening after cooldown");
                     require(harness.backend().emit_result("hey jacq"), "second fragment");
                     require(harness.wakes() == 1, "suppressed within min interval");
                     require_state(harness, DetectorState::Listening, "suppression keeps listening");
                     require(capture.events_of<obs::WakeSuppressedEvent>().size() == 1,
                             "suppression recorded");

                     harness.advance(milliseconds(1500));
                     require(harness.backend().emit_result("hey jacq"), "third fragment");
                     require(harness.wakes() == 2, "allowed after min interval");
                   }});

  tests.push_back({"detector_dictation_suspends_and_resumes", [] {
                     DetectorHarness harness;
                     auto &detector = harness.create_enabled();
                     detector.set_dictation_active(true);
                     require_state(harness, DetectorState::Suspended, "dictation on");
                     require(harness.backend().stops() == 1, "stopped exactly once");
                     detector.set_dictation_active(true);
                     require(harness.backend().stops() == 1, "repeat flag ignored");
                     harness.advance(milliseconds(14000));
                     require_state(harness, DetectorState::Suspended, "watchdog stays away");
                     detector.set_dictation_active(false);
                     require_state(harness, DetectorState::Listening, "dictation off");
                     require(harness.backend().sessions_created() == 2, "new session");
                   }});

  tests.push_back({"detector_dictation_at_construction_blocks_start", [] {
                     DetectorHarness harness;
                     auto &detector = harness.create(
                         DetectorOptions{.enabled = true, .dictation_active = true, .seed = 7});
                     require_state(harness, DetectorState::Idle, "dictating");
                     require(harness.backend().sessions_created() == 0, "no session");
                     detector.set_dictation_active(false);
                     require_state(harness, DetectorState::Listening, "after dictation");
                   }});

  tests.push_back({"detector_hidden_page_suspends_until_visible", [] {
                     DetectorHarness harness;
                     auto &detector = harness.create_enabled();
                     detector.set_page_visible(false);
                     require_state(harness, DetectorState::Suspended, "hidden");
                     require(harness.backend().stops() == 1, "stopped");
                     harness.advance(milliseconds(14000));
                     require_state(harness, DetectorState::Suspended, "still hidden");
                     detector.set_page_visible(true);
                     require_state(harness, DetectorState::Listening, "visible again");
                   }});

  tests.push_back({"detector_hidden_page_during_cooldown_suspends", [] {
                     DetectorHarness harness;
                     auto &detector = harness.create_enabled();
                     require(harness.backend().emit_result("hey jacq"), "wake");
                     require_state(harness, DetectorState::Cooldown, "after wake");
                     require(detector.cooldown_pending(), "cooldown scheduled");
                     detector.set_page_visible(false);
                     require_state(harness, DetectorState::Suspended, "hidden in cooldown");
                     require(!detector.cooldown_pending(), "cooldown timer cancelled");
                     harness.advance(milliseconds(5000));
                     require_state(harness, DetectorState::Suspended, "cooldown expiry ignored");
                     require(harness.backend().sessions_created() == 1, "no restart while hidden");
                     detector.set_page_visible(true);
                     require_state(harness, DetectorState::Listening, "visible again");
                     require(harness.backend().sessions_created() == 2, "fresh session");
                   }});

  tests.push_back({"detector_hidden_at_construction_waits", [] {
                     DetectorHarness harness;
                     auto &detector = harness.create(
                         DetectorOptions{.enabled = true, .page_visible = false, .seed = 7});
                     require_state(harness, DetectorState::Idle, "hidden at start");
                     detector.set_page_visible(true);
                     require_state(harness, DetectorState::Listening, "shown");
                   }});

  tests.push_back({"detector_manual_suspend_beats_watchdog", [] {
                     DetectorHarness harness;
                     auto &detector = harness.create_enabled();
                     detector.suspend();
                     require_state(harness, DetectorState::Suspended, "suspended");
                     require(detector.snapshot().manually_suspended, "flag set");
                     harness.advance(milliseconds(21000));
                     require_state(harness, DetectorState::Suspended, "watchdog does not resume");
                     detector.set_page_visible(false);
                     detector.set_page_visible(true);
                     require_state(harness, DetectorState::Suspended, "visibility does not resume");
                     detector.resume();
                     require_state(harness, DetectorState::Listening, "resumed");
                   }});

  tests.push_back({"detector_permission_denied_blocks_restarts", [] {
                     DetectorHarness harness;
                     auto &detector = harness.create_enabled();
                     require(harness.backend().emit_error("not-allowed"), "error");
                     require_state(harness, DetectorState::Error, "denied");
                     require(detector.has_permission().has_value() && !*detector.has_permission(),
                             "permission false");
                     require(detector.error().value_or("") == "Microphone permission denied",
                             "error message");
                     require(!detector.restart_pending(), "no restart");
                     harness.advance(milliseconds(20000));
                     require_state(harness, DetectorState::Error, "still blocked");
                     require(harness.backend().sessions_created() == 1, "no new sessions");

                     detector.enable();
                     require_state(harness, DetectorState::Listening, "explicit enable retries");
                     require(!detector.error().has_value(), "error cleared");
                   }});

  tests.push_back({"detector_service_not_allowed_is_permission_denial", [] {
                     DetectorHarness harness;
                     harness.create_enabled();
                     require(harness.backend().emit_error("service-not-allowed"), "error");
                     require_state(harness, DetectorState::Error, "denied");
                     harness.advance(milliseconds(20000));
                     require(harness.backend().sessions_created() == 1, "no restart");
                   }});

  tests.push_back({"detector_transient_error_restarts_after_jitter", [] {
                     DetectorHarness harness;
                     auto &detector = harness.create_enabled();
                     require(harness.backend().emit_error("network"), "error");
                     require_state(harness, DetectorState::Error, "transient error");
                     require(detector.restart_pending(), "restart scheduled");
                     harness.advance(milliseconds(599));
                     require_state(harness, DetectorState::Error, "before minimum delay");
                     harness.advance(milliseconds(401));
                     require_state(harness, DetectorState::Listening, "by maximum delay");
                     require(!detector.error().has_value(), "error cleared");
                   }});

  tests.push_back({"detector_engine_end_restarts_with_jitter", [] {
                     DetectorHarness harness;
                     auto &detector = harness.create_enabled();
                     require(harness.backend().emit_end(), "end");
                     require_state(harness, DetectorState::Listening, "restart gap");
                     require(detector.restart_pending(), "restart scheduled");
                     harness.advance(milliseconds(599));
                     require(harness.backend().sessions_created() == 1, "not yet");
                     harness.advance(milliseconds(401));
                     require(harness.backend().sessions_created() == 2, "restarted");
                     require(harness.backend().live_session() != nullptr &&
                                 harness.backend().live_session()->running(),
                             "new session running");
                   }});

  tests.push_back({"detector_burst_profile_restarts_on_fixed_delay", [] {
                     DetectorHarness harness(ht::test_wake_config(), ht::ANDROID_FIREFOX_UA);
                     harness.create_enabled();
                     require_state(harness, DetectorState::Listening, "android firefox");
                     const auto settings = harness.backend().last_settings();
                     require(settings.has_value() && !settings->continuous, "burst session");
                     require(harness.backend().emit_end(), "utterance ended");
                     harness.advance(milliseconds(999));
                     require(harness.backend().sessions_created() == 1, "999ms");
                     harness.advance(milliseconds(1));
                     require(harness.backend().sessions_created() == 2, "1000ms");
                   }});

  tests.push_back({"detector_watchdog_heals_failed_start", [] {
                     const ht::ObserverCapture capture;
                     DetectorHarness harness;
                     harness.backend().fail_next_start("device busy");
                     auto &detector = harness.create_enabled();
                     require_state(harness, DetectorState::Error, "start failed");
                     require(detector.error().value_or("") == "device busy", "error message");
                     require(!detector.restart_pending(), "no restart timer");
                     harness.advance(milliseconds(6999));
                     require_state(harness, DetectorState::Error, "before watchdog");
                     harness.advance(milliseconds(1));
                     require_state(harness, DetectorState::Listening, "watchdog restarted");
                     const auto ticks = capture.events_of<obs::WatchdogRestartEvent>();
                     require(ticks.size() == 1 && ticks[0].state == "error", "watchdog recorded");
                   }});

  tests.push_back({"detector_watchdog_disabled_with_zero_interval", [] {
                     auto config = ht::test_wake_config();
                     config.watchdog_interval = milliseconds(0);
                     DetectorHarness harness(config);
                     harness.backend().fail_next_start("device busy");
                     auto &detector = harness.create_enabled();
                     require(!detector.watchdog_armed(), "not armed");
                     harness.advance(milliseconds(30000));
                     require_state(harness, DetectorState::Error, "nothing heals");
                   }});

  tests.push_back({"detector_disable_cancels_cooldown_and_watchdog", [] {
                     DetectorHarness harness;
                     auto &detector = harness.create_enabled();
                     require(harness.backend().emit_result("hey jacq"), "wake");
                     require(detector.cooldown_pending(), "cooldown pending");
                     detector.disable();
                     require_state(harness, DetectorState::Idle, "disabled");
                     require(harness.timers().pending() == 0, "every timer cancelled");
                     harness.advance(milliseconds(30000));
                     require_state(harness, DetectorState::Idle, "stays idle");
                     require(harness.backend().sessions_created() == 1, "no restart");
                   }});

  tests.push_back({"detector_disable_cancels_pending_restart", [] {
                     DetectorHarness harness;
                     auto &detector = harness.create_enabled();
                     require(harness.backend().emit_end(), "end");
                     require(detector.restart_pending(), "restart pending");
                     detector.disable();
                     require(!detector.restart_pending(), "restart cancelled");
                     require(harness.timers().pending() == 0, "no timers");
                     harness.advance(milliseconds(5000));
                     require(harness.backend().sessions_created() == 1, "no restart");
                   }});

  tests.push_back({"detector_speech_output_completed_ends_cooldown", [] {
                     DetectorHarness harness;
                     auto &detector = harness.create_enabled();
                     require(harness.backend().emit_result("hey jacq"), "wake");
                     harness.advance(milliseconds(1000));
                     detector.notify_speech_output_completed();
                     require_state(harness, DetectorState::Listening, "resumed early");
                     require(!detector.cooldown_pending(), "cooldown cancelled");
                   }});

  tests.push_back({"detector_speech_output_completed_recovers_from_error", [] {
                     DetectorHarness harness;
                     auto &detector = harness.create_enabled();
                     require(harness.backend().emit_error("aborted"), "error");
                     require(detector.restart_pending(), "restart pending");
                     detector.notify_speech_output_completed();
                     require_state(harness, DetectorState::Listening, "recovered");
                     require(!detector.restart_pending(), "restart superseded");
                   }});

  tests.push_back({"detector_throwing_callback_is_contained", [] {
                     const ht::ObserverCapture capture;
                     DetectorHarness harness;
                     harness.on_wake([] { throw std::runtime_error("host exploded"); });
                     harness.create_enabled();
                     require(harness.backend().emit_result("hey jacq"), "wake");
                     require_state(harness, DetectorState::Cooldown, "cooldown despite throw");
                     const auto errors = capture.events_of<obs::ErrorEvent>();
                     require(!errors.empty() && errors.back().component == "detector" &&
                                 errors.back().message.find("host exploded") != std::string::npos,
                             "callback failure recorded");
                   }});

  tests.push_back({"detector_recovers_after_handler_throws", [] {
                     DetectorHarness harness;
                     auto &detector = harness.create_enabled();
                     obs::set_global_observer(std::make_unique<ThrowOnTransitionObserver>());
                     bool thrown = false;
                     try {
                       detector.suspend();
                     } catch (const std::runtime_error &) {
                       thrown = true;
                     }
                     obs::set_global_observer(nullptr);
                     require(thrown, "observer exception propagates");

                     detector.suspend();
                     require_state(harness, DetectorState::Suspended,
                                   "later events are handled, not queued");
                     detector.resume();
                     require_state(harness, DetectorState::Listening, "resumed");
                     require(harness.backend().sessions_created() == 2, "fresh session");
                   }});

  tests.push_back({"detector_callback_may_disable_detector", [] {
                     DetectorHarness harness;
                     harness.on_wake([&harness] { harness.detector().disable(); });
                     harness.create_enabled();
                     require(harness.backend().emit_result("hey jacq"), "wake");
                     require_state(harness, DetectorState::Idle, "disable ran after the wake");
                     require(harness.timers().pending() == 0, "cooldown cancelled");
                     require(harness.backend().stops() == 1, "engine stopped once");
                   }});

  tests.push_back({"detector_auto_start_off_needs_explicit_enable", [] {
                     auto config = ht::test_wake_config();
                     config.auto_start = false;
                     DetectorHarness harness(config);
                     auto &detector = harness.create_enabled();
                     require_state(harness, DetectorState::Idle, "no automatic start");
                     harness.advance(milliseconds(7000));
                     require_state(harness, DetectorState::Idle, "watchdog does not start it");
                     detector.enable();
                     require_state(harness, DetectorState::Listening, "explicit enable");
                   }});

  tests.push_back({"detector_end_on_stop_does_not_restart_after_suspend", [] {
                     DetectorHarness harness;
                     harness.backend().set_end_on_stop(true);
                     auto &detector = harness.create_enabled();
                     detector.suspend();
                     require(!detector.restart_pending(), "stop's end was detached");
                     harness.advance(milliseconds(20000));
                     require_state(harness, DetectorState::Suspended, "still suspended");
                     require(harness.backend().sessions_created() == 1, "no restart");
                   }});

  tests.push_back({"detector_records_state_transitions", [] {
                     const ht::ObserverCapture capture;
                     DetectorHarness harness;
                     auto &detector = harness.create_enabled();
                     detector.suspend();
                     detector.resume();
                     const auto transitions = capture.events_of<obs::StateTransitionEvent>();
                     require(transitions.size() == 3, "three transitions");
                     require(transitions[0].from == "idle" && transitions[0].to == "listening" &&
                                 transitions[0].reason == "construction",
                             "start transition");
                     require(transitions[1].to == "suspended" &&
                                 transitions[1].reason == "manual suspend",
                             "suspend transition");
                     require(transitions[2].to == "listening" && transitions[2].reason == "resume",
                             "resume transition");
                   }});

  tests.push_back({"detector_snapshot_reports_current_view", [] {
                     DetectorHarness harness;
                     auto &detector = harness.create_enabled();
                     detector.set_page_visible(false);
                     const auto snapshot = detector.snapshot();
                     require(snapshot.state == DetectorState::Suspended, "state");
                     require(snapshot.enabled && snapshot.is_supported, "flags");
                     require(!snapshot.page_visible, "visibility");
                     require(snapshot.sessions_created == 1, "sessions");
                     require(snapshot.device.browser == hotword::capability::BrowserEngine::Firefox,
                             "device");
                   }});
}
