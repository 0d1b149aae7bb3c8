#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "hotword/engine/adapter.hpp"
#include "hotword/engine/scripted_backend.hpp"

#include <string>
#include <vector>

namespace {

struct ListenerLog {
  std::vector<std::string> fragments;
  std::vector<hotword::engine::EngineError> errors;
  int ended = 0;
};

hotword::engine::AdapterListener listen_into(ListenerLog &log) {
  return hotword::engine::AdapterListener{
      .on_fragment = [&log](const std::string &fragment) { log.fragments.push_back(fragment); },
      .on_ended = [&log]() { ++log.ended; },
      .on_error = [&log](const hotword::engine::EngineError &error) {
        log.errors.push_back(error);
      },
  };
}

} // namespace

void register_engine_tests(std::vector<hotword::tests::TestCase> &tests) {
  using hotword::tests::require;
  namespace eng = hotword::engine;

  tests.push_back({"engine_classifies_permission_errors", [] {
                     require(eng::classify_error("not-allowed").permission_denied(),
                             "not-allowed denies permission");
                     require(eng::classify_error("service-not-allowed").permission_denied(),
                             "service-not-allowed denies permission");
                     for (const char *code : {"no-speech", "network", "aborted", "audio-capture"}) {
                       require(!eng::classify_error(code).permission_denied(),
                               std::string("transient: ") + code);
                     }
                     const auto blank = eng::classify_error("");
                     require(blank.code == "error", "empty code gets a placeholder");
                     require(blank.kind == eng::EngineErrorKind::Transient, "blank is transient");
                   }});

  tests.push_back({"engine_describes_error_codes", [] {
                     require(eng::describe_error("not-allowed") == "Microphone permission denied",
                             "permission message");
                     require(eng::describe_error("no-speech") == "No speech detected",
                             "no speech message");
                     require(eng::describe_error("bad-grammar") ==
                                 "Speech recognition error: bad-grammar",
                             "unknown codes are named");
                     require(eng::classify_error("network").message ==
                                 "Speech recognition network error",
                             "classified error carries the message");
                   }});

  tests.push_back({"engine_settings_follow_profile", [] {
                     eng::ScriptedBackend backend;
                     eng::EngineAdapter burst(
                         backend, eng::EngineProfile::burst_profile(std::chrono::milliseconds(1000)),
                         "en-GB");
                     require(!burst.settings().continuous, "burst sessions are one-shot");
                     require(!burst.settings().interim_results, "burst has no interim results");
                     require(burst.settings().language == "en-GB", "language carried");

                     auto status = burst.start();
                     require(status.ok(), status.error());
                     const auto settings = backend.last_settings();
                     require(settings.has_value() && !settings->continuous,
                             "backend received burst settings");

                     eng::EngineAdapter continuous(backend, eng::EngineProfile::continuous_profile());
                     require(continuous.settings().continuous &&
                                 continuous.settings().interim_results,
                             "continuous settings");
                   }});

  tests.push_back({"engine_start_creates_fresh_session_each_time", [] {
                     eng::ScriptedBackend backend;
                     eng::EngineAdapter adapter(backend, eng::EngineProfile::continuous_profile());
                     ListenerLog log;
                     adapter.set_listener(listen_into(log));

                     require(adapter.start().ok(), "first start");
                     const auto first = backend.live_session();
                     require(first != nullptr && first->id() == 1, "first session");
                     require(adapter.start().ok(), "second start");
                     require(backend.live_session() != nullptr && backend.live_session()->id() == 2,
                             "second start builds a new session");
                     require(adapter.sessions_created() == 2, "adapter count");
                     require(backend.stops() == 1, "previous session was stopped");
                     require(adapter.active(), "adapter active");
                   }});

  tests.push_back({"engine_forwards_fragments_errors_and_end", [] {
                     eng::ScriptedBackend backend;
                     eng::EngineAdapter adapter(backend, eng::EngineProfile::continuous_profile());
                     ListenerLog log;
                     adapter.set_listener(listen_into(log));
                     require(adapter.start().ok(), "start");

                     require(backend.emit_result("hey jacq", false), "interim result");
                     require(backend.emit_result("", true), "empty result");
                     require(backend.emit_error("no-speech"), "error");
                     require(log.fragments.size() == 1 && log.fragments[0] == "hey jacq",
                             "empty transcripts are dropped");
                     require(log.errors.size() == 1 && log.errors[0].code == "no-speech",
                             "error forwarded");

                     require(backend.emit_end(), "end");
                     require(log.ended == 1, "end forwarded");
                     require(!adapter.active(), "ended session is not active");
                   }});

  tests.push_back({"engine_stop_detaches_callbacks_before_native_stop", [] {
                     eng::ScriptedBackend backend;
                     backend.set_end_on_stop(true);
                     eng::EngineAdapter adapter(backend, eng::EngineProfile::continuous_profile());
                     ListenerLog log;
                     adapter.set_listener(listen_into(log));
                     require(adapter.start().ok(), "start");
                     adapter.stop();
                     require(log.ended == 0, "end raised by native stop must not reach listener");
                     require(!adapter.active(), "inactive after stop");
                     require(backend.stops() == 1, "native stop called once");
                     adapter.stop();
                     require(backend.stops() == 1, "stop is idempotent");
                   }});

  tests.push_back({"engine_stale_session_signals_are_ignored", [] {
                     eng::ScriptedBackend backend;
                     eng::EngineAdapter adapter(backend, eng::EngineProfile::continuous_profile());
                     ListenerLog log;
                     adapter.set_listener(listen_into(log));
                     require(adapter.start().ok(), "start");

                     eng::SessionSettings settings;
                     auto stray = backend.create_session(settings);
                     require(stray != nullptr, "stray session");
                     require(stray->start().ok(), "stray start");
                     require(backend.emit_result("hey jacq"), "stray result");
                     require(backend.emit_end(), "stray end");
                     require(log.fragments.empty() && log.ended == 0,
                             "signals from a session the adapter did not start are ignored");
                     require(adapter.active(), "adapter session unaffected");
                   }});

  tests.push_back({"engine_listener_may_stop_from_callback", [] {
                     eng::ScriptedBackend backend;
                     eng::EngineAdapter adapter(backend, eng::EngineProfile::continuous_profile());
                     int fragments = 0;
                     adapter.set_listener(eng::AdapterListener{
                         .on_fragment =
                             [&](const std::string &) {
                               ++fragments;
                               adapter.stop();
                             },
                         .on_ended = {},
                         .on_error = {},
                     });
                     require(adapter.start().ok(), "start");
                     require(backend.emit_result("hey jacq"), "result");
                     require(fragments == 1, "fragment delivered once");
                     require(!adapter.active(), "stopped from inside the callback");
                     require(!backend.emit_result("again"), "stopped session emits nothing");
                   }});

  tests.push_back({"engine_start_failure_reports_error", [] {
                     const hotword::testing::ObserverCapture capture;
                     eng::ScriptedBackend backend;
                     eng::EngineAdapter adapter(backend, eng::EngineProfile::continuous_profile());
                     backend.fail_next_start("microphone busy");
                     const auto status = adapter.start();
                     require(!status.ok() && status.error() == "microphone busy", "start fails");
                     require(!adapter.active(), "failed session is not active");
                     require(backend.live_session() == nullptr, "failed session released");

                     const auto sessions =
                         capture.events_of<hotword::observability::EngineSessionEvent>();
                     require(!sessions.empty() && sessions.back().action == "start-failed",
                             "failure recorded");
                     require(adapter.start().ok(), "next start succeeds");
                   }});

  tests.push_back({"engine_unavailable_backend_fails_start", [] {
                     eng::ScriptedBackend backend(false);
                     eng::EngineAdapter adapter(backend, eng::EngineProfile::continuous_profile());
                     const auto status = adapter.start();
                     require(!status.ok(), "no session without the primitive");
                     require(status.error().find("scripted") != std::string::npos,
                             "error names the backend");
                     require(adapter.sessions_created() == 0, "nothing created");
                   }});
}
