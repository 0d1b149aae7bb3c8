#include "hotword/engine/adapter.hpp"

#include "hotword/observability/global.hpp"

namespace hotword::engine {

class EngineAdapter::CallbackScope {
public:
  explicit CallbackScope(EngineAdapter &adapter) : adapter_(adapter) { ++adapter_.callback_depth_; }
  ~CallbackScope() {
    --adapter_.callback_depth_;
    adapter_.reap();
  }

  CallbackScope(const CallbackScope &) = delete;
  CallbackScope &operator=(const CallbackScope &) = delete;

private:
  EngineAdapter &adapter_;
};

EngineAdapter::EngineAdapter(IRecognitionBackend &backend, EngineProfile profile,
                             std::string language)
    : backend_(backend), profile_(std::move(profile)) {
  settings_.continuous = profile_.continuous;
  settings_.interim_results = profile_.interim_results;
  settings_.language = std::move(language);
}

EngineAdapter::~EngineAdapter() {
  stop();
  retired_.clear();
}

void EngineAdapter::set_listener(AdapterListener listener) { listener_ = std::move(listener); }

bool EngineAdapter::active() const { return session_ != nullptr && running_; }

bool EngineAdapter::is_current(const std::uint64_t generation) const {
  return session_ != nullptr && generation == generation_;
}

common::Status EngineAdapter::start() {
  stop();
  reap();

  auto session = backend_.create_session(settings_);
  if (session == nullptr) {
    return common::Status::error(std::string(backend_.name()) +
                                 ": unable to create a recognition session");
  }

  const std::uint64_t generation = ++generation_;
  ++sessions_created_;
  session->set_callbacks(make_callbacks(generation));

  auto status = session->start();
  if (!status.ok()) {
    session->set_callbacks({});
    retire(std::move(session));
    observability::record_event(
        observability::EngineSessionEvent{.action = "start-failed", .session = generation});
    return status;
  }

  session_ = std::move(session);
  running_ = true;
  observability::record_event(
      observability::EngineSessionEvent{.action = "started", .session = generation});
  observability::record_metric(observability::SessionsCreatedMetric{.count = sessions_created_});
  return common::Status::success();
}

void EngineAdapter::stop() {
  if (session_ == nullptr) {
    return;
  }
  auto session = std::move(session_);
  running_ = false;
  session->set_callbacks({});
  session->stop();
  observability::record_event(
      observability::EngineSessionEvent{.action = "stopped", .session = generation_});
  retire(std::move(session));
}

void EngineAdapter::retire(std::unique_ptr<IRecognitionSession> session) {
  retired_.push_back(std::move(session));
  reap();
}

void EngineAdapter::reap() {
  if (callback_depth_ == 0) {
    retired_.clear();
  }
}

SessionCallbacks EngineAdapter::make_callbacks(const std::uint64_t generation) {
  SessionCallbacks callbacks;
  callbacks.on_result = [this, generation](const std::string &transcript, bool) {
    if (!is_current(generation) || transcript.empty()) {
      return;
    }
    CallbackScope scope(*this);
    if (listener_.on_fragment) {
      listener_.on_fragment(transcript);
    }
  };
  callbacks.on_error = [this, generation](const std::string &code) {
    if (!is_current(generation)) {
      return;
    }
    CallbackScope scope(*this);
    if (listener_.on_error) {
      listener_.on_error(classify_error(code));
    }
  };
  callbacks.on_end = [this, generation]() {
    if (!is_current(generation)) {
      return;
    }
    running_ = false;
    CallbackScope scope(*this);
    observability::record_event(
        observability::EngineSessionEvent{.action = "ended", .session = generation});
    if (listener_.on_ended) {
      listener_.on_ended();
    }
  };
  return callbacks;
}

} // namespace hotword::engine
