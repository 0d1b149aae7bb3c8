#pragma once

#include "hotword/common/result.hpp"
#include "hotword/engine/recognition.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace hotword::engine {

struct AdapterListener {
  std::function<void(const std::string &fragment)> on_fragment;
  std::function<void()> on_ended;
  std::function<void(const EngineError &error)> on_error;
};

/// Owns at most one live recognition session. Every start() builds a fresh
/// session; stop() detaches the callbacks before the native stop so nothing
/// the old session reports afterwards can reach the listener.
class EngineAdapter {
public:
  EngineAdapter(IRecognitionBackend &backend, EngineProfile profile,
                std::string language = "en-US");
  ~EngineAdapter();

  EngineAdapter(const EngineAdapter &) = delete;
  EngineAdapter &operator=(const EngineAdapter &) = delete;

  void set_listener(AdapterListener listener);

  [[nodiscard]] common::Status start();
  void stop();

  [[nodiscard]] bool active() const;
  [[nodiscard]] std::uint64_t current_session() const { return generation_; }
  [[nodiscard]] std::uint64_t sessions_created() const { return sessions_created_; }
  [[nodiscard]] const EngineProfile &profile() const { return profile_; }
  [[nodiscard]] const SessionSettings &settings() const { return settings_; }

private:
  class CallbackScope;

  [[nodiscard]] SessionCallbacks make_callbacks(std::uint64_t generation);
  [[nodiscard]] bool is_current(std::uint64_t generation) const;
  void retire(std::unique_ptr<IRecognitionSession> session);
  void reap();

  IRecognitionBackend &backend_;
  EngineProfile profile_;
  SessionSettings settings_;
  AdapterListener listener_;

  std::unique_ptr<IRecognitionSession> session_;
  // A session may be stopped from inside its own callback; its handle is
  // released once no callback is on the stack.
  std::vector<std::unique_ptr<IRecognitionSession>> retired_;
  std::uint64_t generation_ = 0;
  std::uint64_t sessions_created_ = 0;
  int callback_depth_ = 0;
  bool running_ = false;
};

} // namespace hotword::engine
