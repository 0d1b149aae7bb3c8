#include "hotword/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace hotword::observability {

LogObserver::LogObserver(const bool debug) : LogObserver(std::cerr, debug) {}

LogObserver::LogObserver(std::ostream &out, const bool debug) : out_(out), debug_(debug) {}

void LogObserver::log_line(const std::string_view level, const std::string &message) {
  if (level == "DEBUG" && !debug_) {
    return;
  }
  out_ << "[" << level << "] [wakeword] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, StateTransitionEvent>) {
          log_line("INFO", "state " + evt.from + " -> " + evt.to + " (" + evt.reason + ")");
        } else if constexpr (std::is_same_v<T, WakeTriggeredEvent>) {
          log_line("INFO", "wake phrase=\"" + evt.phrase + "\" distance=" +
                               std::to_string(evt.distance) + " fragment=\"" + evt.fragment +
                               "\"");
        } else if constexpr (std::is_same_v<T, WakeSuppressedEvent>) {
          log_line("DEBUG", "wake suppressed: " + evt.reason);
        } else if constexpr (std::is_same_v<T, EngineSessionEvent>) {
          log_line("DEBUG", "engine session=" + std::to_string(evt.session) + " " + evt.action);
        } else if constexpr (std::is_same_v<T, EngineErrorEvent>) {
          log_line(evt.permission_denied ? "ERROR" : "WARN", "engine error code=" + evt.code);
        } else if constexpr (std::is_same_v<T, RestartScheduledEvent>) {
          log_line("DEBUG", "restart in " + std::to_string(evt.delay.count()) + "ms (" +
                                evt.reason + ")");
        } else if constexpr (std::is_same_v<T, WatchdogRestartEvent>) {
          log_line("INFO", "watchdog restart from state=" + evt.state);
        } else if constexpr (std::is_same_v<T, StartBlockedEvent>) {
          log_line("DEBUG", "not starting: " + evt.reason);
        } else if constexpr (std::is_same_v<T, PreferenceChangedEvent>) {
          log_line("DEBUG", "preference " + evt.key + "=" + evt.value);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, SessionsCreatedMetric>) {
          log_line("DEBUG", "metric.sessions_created=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, WakeTriggersMetric>) {
          log_line("DEBUG", "metric.wake_triggers=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() { out_.flush(); }

} // namespace hotword::observability
