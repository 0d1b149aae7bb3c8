#pragma once

#include "hotword/engine/recognition.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace hotword::engine {

class ScriptedBackend;

class ScriptedSession final : public IRecognitionSession {
public:
  ScriptedSession(ScriptedBackend &owner, SessionSettings settings, std::uint64_t id);
  ~ScriptedSession() override;

  ScriptedSession(const ScriptedSession &) = delete;
  ScriptedSession &operator=(const ScriptedSession &) = delete;

  void set_callbacks(SessionCallbacks callbacks) override;
  [[nodiscard]] common::Status start() override;
  void stop() override;

  void emit_result(const std::string &transcript, bool is_final);
  void emit_error(const std::string &code);
  void emit_end();

  [[nodiscard]] bool running() const { return running_; }
  [[nodiscard]] bool has_callbacks() const;
  [[nodiscard]] std::uint64_t id() const { return id_; }
  [[nodiscard]] const SessionSettings &settings() const { return settings_; }

private:
  ScriptedBackend &owner_;
  SessionSettings settings_;
  std::uint64_t id_ = 0;
  SessionCallbacks callbacks_;
  bool running_ = false;
  bool started_once_ = false;
};

// Signals are pushed into the most recently started session.
class ScriptedBackend final : public IRecognitionBackend {
public:
  explicit ScriptedBackend(bool available = true);

  [[nodiscard]] bool available() const override { return available_; }
  [[nodiscard]] std::unique_ptr<IRecognitionSession>
  create_session(const SessionSettings &settings) override;
  [[nodiscard]] std::string_view name() const override { return "scripted"; }

  // Each returns false when no session is running.
  bool emit_result(const std::string &transcript, bool is_final = true);
  bool emit_error(const std::string &code);
  bool emit_end();

  void fail_next_start(std::string message);
  // Native stop() also reports an end, as some platforms do.
  void set_end_on_stop(bool value) { end_on_stop_ = value; }

  [[nodiscard]] ScriptedSession *live_session() const { return live_; }
  [[nodiscard]] std::uint64_t sessions_created() const { return sessions_created_; }
  [[nodiscard]] std::uint64_t starts() const { return starts_; }
  [[nodiscard]] std::uint64_t stops() const { return stops_; }
  [[nodiscard]] std::optional<SessionSettings> last_settings() const { return last_settings_; }

private:
  friend class ScriptedSession;

  void forget(const ScriptedSession *session);

  bool available_ = true;
  bool end_on_stop_ = false;
  std::optional<std::string> fail_next_start_;
  std::optional<SessionSettings> last_settings_;
  ScriptedSession *live_ = nullptr;
  std::uint64_t sessions_created_ = 0;
  std::uint64_t starts_ = 0;
  std::uint64_t stops_ = 0;
};

} // namespace hotword::engine
