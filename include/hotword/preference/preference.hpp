#pragma once

#include "hotword/common/result.hpp"
#include "hotword/preference/store.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace hotword::preference {

inline constexpr std::string_view PERMISSION_GRANTED_KEY = "wakeword.permission.granted";
inline constexpr std::string_view ENABLED_KEY = "wakeword.enabled";
inline constexpr std::string_view CONSENT_KEY = "wakeword.consent.v1";

inline constexpr std::string_view TRUE_VALUE = "true";
inline constexpr std::string_view DECLINED_VALUE = "declined";

enum class Consent { Pending, Accepted, Declined };

[[nodiscard]] std::string_view to_string(Consent consent);

struct PreferenceState {
  bool enabled = false;
  Consent consent = Consent::Pending;

  [[nodiscard]] bool active() const { return enabled && consent == Consent::Accepted; }
};

class WakeWordPreference {
public:
  using Listener = std::function<void(const PreferenceState &state)>;

  explicit WakeWordPreference(IPreferenceStore &store);

  [[nodiscard]] common::Status load();
  [[nodiscard]] common::Status set_enabled(bool enabled);
  [[nodiscard]] common::Status accept_consent(bool auto_enable = true);
  [[nodiscard]] common::Status decline_consent();

  void on_change(Listener listener) { listeners_.push_back(std::move(listener)); }

  [[nodiscard]] const PreferenceState &state() const { return state_; }
  [[nodiscard]] bool active() const { return state_.active(); }
  [[nodiscard]] bool loaded() const { return loaded_; }

private:
  [[nodiscard]] common::Status write(std::string_view key, std::string_view value);
  void notify();

  IPreferenceStore &store_;
  PreferenceState state_;
  bool loaded_ = false;
  std::vector<Listener> listeners_;
};

// Persisted flag set once the recognition engine has started successfully.
[[nodiscard]] common::Result<bool> prior_permission_granted(IPreferenceStore &store);
[[nodiscard]] common::Status record_permission_granted(IPreferenceStore &store);

} // namespace hotword::preference
