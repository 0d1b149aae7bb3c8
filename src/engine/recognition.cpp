#include "hotword/engine/recognition.hpp"

namespace hotword::engine {

EngineError classify_error(const std::string_view code) {
  EngineError error;
  error.code = code.empty() ? std::string("error") : std::string(code);
  // Both codes mean the platform refused microphone access.
  if (code == "not-allowed" || code == "service-not-allowed") {
    error.kind = EngineErrorKind::PermissionDenied;
  }
  error.message = describe_error(error.code);
  return error;
}

std::string describe_error(const std::string_view code) {
  if (code == "not-allowed") {
    return "Microphone permission denied";
  }
  if (code == "service-not-allowed") {
    return "Speech recognition service not allowed";
  }
  if (code == "no-speech") {
    return "No speech detected";
  }
  if (code == "audio-capture") {
    return "No microphone available";
  }
  if (code == "network") {
    return "Speech recognition network error";
  }
  if (code == "aborted") {
    return "Speech recognition aborted";
  }
  return "Speech recognition error: " + std::string(code);
}

EngineProfile EngineProfile::continuous_profile() { return EngineProfile{}; }

EngineProfile EngineProfile::burst_profile(const std::chrono::milliseconds restart_delay) {
  return EngineProfile{.name = "burst",
                       .continuous = false,
                       .interim_results = false,
                       .fixed_restart_delay = restart_delay};
}

} // namespace hotword::engine
