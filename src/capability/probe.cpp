#include "hotword/capability/probe.hpp"

#include "hotword/common/fs.hpp"

namespace hotword::capability {

namespace {

bool contains(std::string_view haystack, std::string_view needle) {
  return haystack.find(needle) != std::string_view::npos;
}

} // namespace

PlatformClass DeviceInfo::platform_class() const {
  if (is_android) {
    return PlatformClass::Android;
  }
  if (is_ios) {
    return PlatformClass::Ios;
  }
  if (is_mobile) {
    return PlatformClass::OtherMobile;
  }
  return PlatformClass::Desktop;
}

std::string_view to_string(const BrowserEngine browser) {
  switch (browser) {
  case BrowserEngine::Chrome:
    return "chrome";
  case BrowserEngine::Firefox:
    return "firefox";
  case BrowserEngine::Safari:
    return "safari";
  case BrowserEngine::Edge:
    return "edge";
  case BrowserEngine::Unknown:
    break;
  }
  return "unknown";
}

std::string_view to_string(const PlatformClass platform) {
  switch (platform) {
  case PlatformClass::Desktop:
    return "desktop";
  case PlatformClass::Android:
    return "android";
  case PlatformClass::Ios:
    return "ios";
  case PlatformClass::OtherMobile:
    return "mobile";
  }
  return "desktop";
}

DeviceInfo classify_device(const std::string_view user_agent) {
  const std::string lower = common::to_lower(std::string(user_agent));

  DeviceInfo info;
  info.is_android = contains(lower, "android");
  info.is_ios = contains(user_agent, "iPad") || contains(user_agent, "iPhone") ||
                contains(user_agent, "iPod");
  info.is_mobile = contains(lower, "mobi") || info.is_android;

  // Edge and most Android browsers also advertise "Chrome", so it wins first.
  if (contains(user_agent, "Chrome")) {
    info.browser = BrowserEngine::Chrome;
  } else if (contains(user_agent, "Firefox")) {
    info.browser = BrowserEngine::Firefox;
  } else if (contains(user_agent, "Safari")) {
    info.browser = BrowserEngine::Safari;
  } else if (contains(user_agent, "Edge")) {
    info.browser = BrowserEngine::Edge;
  }
  return info;
}

Environment detect_environment(const config::ProbeConfig &config,
                               const engine::IRecognitionBackend &backend) {
  return Environment{.user_agent = config.user_agent,
                     .recognition_available = config.recognition_available &&
                                              backend.available()};
}

CapabilityProbe::CapabilityProbe(Environment environment, const config::WakeWordConfig &wake)
    : environment_(std::move(environment)), device_(classify_device(environment_.user_agent)) {
  if (!environment_.recognition_available) {
    reason_ = "speech recognition is not available";
  } else if (device_.is_android && device_.browser == BrowserEngine::Chrome) {
    reason_ = "continuous listening is unreliable on Android Chrome";
  } else if (device_.is_ios && device_.browser == BrowserEngine::Safari) {
    reason_ = "iOS Safari restricts background audio capture";
  }
  supported_ = reason_.empty();

  profile_ = device_.is_android ? engine::EngineProfile::burst_profile(wake.burst_restart_delay)
                                : engine::EngineProfile::continuous_profile();
}

} // namespace hotword::capability
