#pragma once

#include "hotword/config/schema.hpp"
#include "hotword/engine/recognition.hpp"

#include <string>
#include <string_view>

namespace hotword::capability {

enum class BrowserEngine {
  Chrome,
  Firefox,
  Safari,
  Edge,
  Unknown,
};

enum class PlatformClass {
  Desktop,
  Android,
  Ios,
  OtherMobile,
};

struct DeviceInfo {
  bool is_android = false;
  bool is_ios = false;
  bool is_mobile = false;
  BrowserEngine browser = BrowserEngine::Unknown;

  [[nodiscard]] PlatformClass platform_class() const;
};

struct Environment {
  std::string user_agent;
  bool recognition_available = true;
};

[[nodiscard]] std::string_view to_string(BrowserEngine browser);
[[nodiscard]] std::string_view to_string(PlatformClass platform);

[[nodiscard]] DeviceInfo classify_device(std::string_view user_agent);

// Recognition counts as present only if both the config and the backend say so.
[[nodiscard]] Environment detect_environment(const config::ProbeConfig &config,
                                             const engine::IRecognitionBackend &backend);

class CapabilityProbe {
public:
  CapabilityProbe(Environment environment, const config::WakeWordConfig &wake);

  [[nodiscard]] bool is_supported() const { return supported_; }
  [[nodiscard]] const DeviceInfo &device_info() const { return device_; }
  [[nodiscard]] const std::string &unsupported_reason() const { return reason_; }
  [[nodiscard]] const engine::EngineProfile &engine_profile() const { return profile_; }
  [[nodiscard]] const Environment &environment() const { return environment_; }

private:
  Environment environment_;
  DeviceInfo device_;
  bool supported_ = false;
  std::string reason_;
  engine::EngineProfile profile_;
};

} // namespace hotword::capability
