#pragma once

#include "hotword/engine/recognition.hpp"

#include <string>
#include <variant>

namespace hotword::detector {

// Host requests.
struct EnableRequested {};
struct DisableRequested {};
struct SuspendRequested {};
struct ResumeRequested {};

// Host signals.
struct DictationActiveChanged {
  bool active = false;
};
struct VisibilityChanged {
  bool visible = true;
};
struct UserInteracted {};
struct SpeechOutputCompleted {};

// Engine signals.
struct FragmentReceived {
  std::string text;
};
struct EngineEnded {};
struct EngineFailed {
  engine::EngineError error;
};

// Timers.
struct CooldownElapsed {};
struct RestartDue {};
struct WatchdogTick {};

using DetectorEvent =
    std::variant<EnableRequested, DisableRequested, SuspendRequested, ResumeRequested,
                 DictationActiveChanged, VisibilityChanged, UserInteracted,
                 SpeechOutputCompleted, FragmentReceived, EngineEnded, EngineFailed,
                 CooldownElapsed, RestartDue, WatchdogTick>;

} // namespace hotword::detector
