#pragma once

#include <string_view>

namespace hotword::detector {

enum class DetectorState {
  Idle,
  Listening,
  Cooldown,
  Suspended,
  Error,
  Unsupported,
};

[[nodiscard]] constexpr std::string_view to_string(const DetectorState state) {
  switch (state) {
  case DetectorState::Idle:
    return "idle";
  case DetectorState::Listening:
    return "listening";
  case DetectorState::Cooldown:
    return "cooldown";
  case DetectorState::Suspended:
    return "suspended";
  case DetectorState::Error:
    return "error";
  case DetectorState::Unsupported:
    return "unsupported";
  }
  return "idle";
}

} // namespace hotword::detector
