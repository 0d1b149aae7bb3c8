#include "hotword/engine/scripted_backend.hpp"

namespace hotword::engine {

ScriptedSession::ScriptedSession(ScriptedBackend &owner, SessionSettings settings,
                                 const std::uint64_t id)
    : owner_(owner), settings_(std::move(settings)), id_(id) {}

ScriptedSession::~ScriptedSession() { owner_.forget(this); }

void ScriptedSession::set_callbacks(SessionCallbacks callbacks) {
  callbacks_ = std::move(callbacks);
}

bool ScriptedSession::has_callbacks() const {
  return callbacks_.on_result || callbacks_.on_error || callbacks_.on_end;
}

common::Status ScriptedSession::start() {
  if (started_once_) {
    return common::Status::error("recognition session has already been started");
  }
  if (owner_.fail_next_start_.has_value()) {
    auto message = std::move(*owner_.fail_next_start_);
    owner_.fail_next_start_.reset();
    return common::Status::error(message);
  }
  started_once_ = true;
  running_ = true;
  ++owner_.starts_;
  owner_.live_ = this;
  return common::Status::success();
}

void ScriptedSession::stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  ++owner_.stops_;
  if (owner_.end_on_stop_) {
    auto on_end = callbacks_.on_end;
    if (on_end) {
      on_end();
    }
  }
}

void ScriptedSession::emit_result(const std::string &transcript, const bool is_final) {
  auto on_result = callbacks_.on_result;
  if (running_ && on_result) {
    const std::string copy = transcript;
    on_result(copy, is_final);
  }
}

void ScriptedSession::emit_error(const std::string &code) {
  auto on_error = callbacks_.on_error;
  if (running_ && on_error) {
    on_error(code);
  }
}

void ScriptedSession::emit_end() {
  if (!running_) {
    return;
  }
  running_ = false;
  auto on_end = callbacks_.on_end;
  if (on_end) {
    on_end();
  }
}

ScriptedBackend::ScriptedBackend(const bool available) : available_(available) {}

std::unique_ptr<IRecognitionSession>
ScriptedBackend::create_session(const SessionSettings &settings) {
  if (!available_) {
    return nullptr;
  }
  last_settings_ = settings;
  return std::make_unique<ScriptedSession>(*this, settings, ++sessions_created_);
}

bool ScriptedBackend::emit_result(const std::string &transcript, const bool is_final) {
  if (live_ == nullptr || !live_->running()) {
    return false;
  }
  live_->emit_result(transcript, is_final);
  return true;
}

bool ScriptedBackend::emit_error(const std::string &code) {
  if (live_ == nullptr || !live_->running()) {
    return false;
  }
  live_->emit_error(code);
  return true;
}

bool ScriptedBackend::emit_end() {
  if (live_ == nullptr || !live_->running()) {
    return false;
  }
  live_->emit_end();
  return true;
}

void ScriptedBackend::fail_next_start(std::string message) {
  fail_next_start_ = std::move(message);
}

void ScriptedBackend::forget(const ScriptedSession *session) {
  if (live_ == session) {
    live_ = nullptr;
  }
}

} // namespace hotword::engine
