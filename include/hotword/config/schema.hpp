#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace hotword::config {

// Upper bound for every *_ms setting.
inline constexpr std::chrono::milliseconds MAX_DURATION{86'400'000};

// Read-only for the lifetime of a detector. The first phrase is the display form.
struct WakeWordConfig {
  std::vector<std::string> phrases = {"hey jacq", "hey jack", "hay jack",
                                      "hey jac",  "hey jak",  "hey jake"};
  std::size_t max_distance = 2;
  std::chrono::milliseconds cooldown{4000};
  std::chrono::milliseconds min_interval{2500};
  // Zero disables the watchdog.
  std::chrono::milliseconds watchdog_interval{7000};
  std::chrono::milliseconds restart_delay_min{600};
  std::chrono::milliseconds restart_delay_max{1000};
  std::chrono::milliseconds burst_restart_delay{1000};
  bool require_user_interaction = true;
  bool auto_start = true;
  std::string language = "en-US";
};

struct ProbeConfig {
  std::string user_agent;
  bool recognition_available = true;
};

struct PreferencesConfig {
  // Empty means "preferences.db" next to the config file.
  std::string path;
};

struct ObservabilityConfig {
  std::string backend = "log";
  bool debug = false;
};

struct Config {
  WakeWordConfig wake;
  ProbeConfig probe;
  PreferencesConfig preferences;
  ObservabilityConfig observability;
};

} // namespace hotword::config
