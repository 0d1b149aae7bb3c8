#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace hotword::observability {

struct StateTransitionEvent {
  std::string from;
  std::string to;
  std::string reason;
};

struct WakeTriggeredEvent {
  std::string phrase;
  std::string fragment;
  std::size_t distance = 0;
};

struct WakeSuppressedEvent {
  std::string reason;
};

struct EngineSessionEvent {
  std::string action;
  std::uint64_t session = 0;
};

struct EngineErrorEvent {
  std::string code;
  bool permission_denied = false;
};

struct RestartScheduledEvent {
  std::chrono::milliseconds delay{0};
  std::string reason;
};

struct WatchdogRestartEvent {
  std::string state;
};

struct StartBlockedEvent {
  std::string reason;
};

struct PreferenceChangedEvent {
  std::string key;
  std::string value;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<StateTransitionEvent, WakeTriggeredEvent, WakeSuppressedEvent,
                 EngineSessionEvent, EngineErrorEvent, RestartScheduledEvent,
                 WatchdogRestartEvent, StartBlockedEvent, PreferenceChangedEvent, ErrorEvent>;

struct SessionsCreatedMetric {
  std::uint64_t count = 0;
};

struct WakeTriggersMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<SessionsCreatedMetric, WakeTriggersMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace hotword::observability
