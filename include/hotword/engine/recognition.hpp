#pragma once

#include "hotword/common/result.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace hotword::engine {

struct SessionSettings {
  bool continuous = true;
  bool interim_results = true;
  std::string language = "en-US";
};

// Raw signals of one native recognition run. Error codes use the platform's
// spelling ("not-allowed", "no-speech", "network", ...).
struct SessionCallbacks {
  std::function<void(const std::string &transcript, bool is_final)> on_result;
  std::function<void(const std::string &code)> on_error;
  std::function<void()> on_end;
};

// set_callbacks() and stop() may be called from inside one of the callbacks,
// so implementations invoke a copy of the callback rather than the stored one.
class IRecognitionSession {
public:
  virtual ~IRecognitionSession() = default;

  virtual void set_callbacks(SessionCallbacks callbacks) = 0;
  [[nodiscard]] virtual common::Status start() = 0;
  virtual void stop() = 0;
};

class IRecognitionBackend {
public:
  virtual ~IRecognitionBackend() = default;

  [[nodiscard]] virtual bool available() const = 0;
  [[nodiscard]] virtual std::unique_ptr<IRecognitionSession>
  create_session(const SessionSettings &settings) = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

enum class EngineErrorKind {
  PermissionDenied,
  Transient,
};

struct EngineError {
  EngineErrorKind kind = EngineErrorKind::Transient;
  std::string code;
  std::string message;

  [[nodiscard]] bool permission_denied() const {
    return kind == EngineErrorKind::PermissionDenied;
  }
};

[[nodiscard]] EngineError classify_error(std::string_view code);
[[nodiscard]] std::string describe_error(std::string_view code);

/// How sessions are run on a device class. Burst sessions end after each
/// utterance and are restarted on a fixed delay; continuous sessions are
/// restarted with jitter only when they end unexpectedly.
struct EngineProfile {
  std::string name = "continuous";
  bool continuous = true;
  bool interim_results = true;
  std::optional<std::chrono::milliseconds> fixed_restart_delay;

  [[nodiscard]] static EngineProfile continuous_profile();
  [[nodiscard]] static EngineProfile burst_profile(std::chrono::milliseconds restart_delay);
};

} // namespace hotword::engine
