#include "hotword/preference/preference.hpp"

#include "hotword/observability/global.hpp"

namespace hotword::preference {

namespace {

Consent parse_consent(const std::optional<std::string> &raw) {
  if (!raw.has_value()) {
    return Consent::Pending;
  }
  if (*raw == TRUE_VALUE) {
    return Consent::Accepted;
  }
  if (*raw == DECLINED_VALUE) {
    return Consent::Declined;
  }
  return Consent::Pending;
}

} // namespace

std::string_view to_string(const Consent consent) {
  switch (consent) {
  case Consent::Pending:
    return "pending";
  case Consent::Accepted:
    return "accepted";
  case Consent::Declined:
    return "declined";
  }
  return "pending";
}

WakeWordPreference::WakeWordPreference(IPreferenceStore &store) : store_(store) {}

common::Status WakeWordPreference::load() {
  auto consent = store_.get(std::string(CONSENT_KEY));
  if (!consent.ok()) {
    return consent.status();
  }
  auto enabled = store_.get(std::string(ENABLED_KEY));
  if (!enabled.ok()) {
    return enabled.status();
  }
  state_.consent = parse_consent(consent.value());
  state_.enabled = enabled.value().has_value() && *enabled.value() == TRUE_VALUE;
  loaded_ = true;
  return common::Status::success();
}

common::Status WakeWordPreference::write(const std::string_view key, const std::string_view value) {
  auto status = store_.set(std::string(key), std::string(value));
  if (!status.ok()) {
    observability::record_error("preference", status.error());
    return status;
  }
  observability::record_event(observability::PreferenceChangedEvent{
      .key = std::string(key), .value = std::string(value)});
  return status;
}

common::Status WakeWordPreference::set_enabled(const bool enabled) {
  auto status = write(ENABLED_KEY, enabled ? "true" : "false");
  if (!status.ok()) {
    return status;
  }
  state_.enabled = enabled;
  notify();
  return status;
}

common::Status WakeWordPreference::accept_consent(const bool auto_enable) {
  auto status = write(CONSENT_KEY, TRUE_VALUE);
  if (!status.ok()) {
    return status;
  }
  state_.consent = Consent::Accepted;
  if (auto_enable) {
    status = write(ENABLED_KEY, TRUE_VALUE);
    if (!status.ok()) {
      notify();
      return status;
    }
    state_.enabled = true;
  }
  notify();
  return common::Status::success();
}

common::Status WakeWordPreference::decline_consent() {
  auto status = write(CONSENT_KEY, DECLINED_VALUE);
  if (!status.ok()) {
    return status;
  }
  state_.consent = Consent::Declined;
  status = write(ENABLED_KEY, "false");
  if (status.ok()) {
    state_.enabled = false;
  }
  notify();
  return status;
}

void WakeWordPreference::notify() {
  for (const auto &listener : listeners_) {
    if (listener) {
      listener(state_);
    }
  }
}

common::Result<bool> prior_permission_granted(IPreferenceStore &store) {
  auto value = store.get(std::string(PERMISSION_GRANTED_KEY));
  if (!value.ok()) {
    return common::Result<bool>::failure(value.error());
  }
  return common::Result<bool>::success(value.value().has_value() &&
                                       *value.value() == TRUE_VALUE);
}

common::Status record_permission_granted(IPreferenceStore &store) {
  return store.set(std::string(PERMISSION_GRANTED_KEY), std::string(TRUE_VALUE));
}

} // namespace hotword::preference
