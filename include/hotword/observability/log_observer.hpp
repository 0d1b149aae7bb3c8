#pragma once

#include "hotword/observability/observer.hpp"

#include <ostream>

namespace hotword::observability {

class LogObserver final : public IObserver {
public:
  explicit LogObserver(bool debug = false);
  LogObserver(std::ostream &out, bool debug);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(std::string_view level, const std::string &message);

  std::ostream &out_;
  bool debug_ = false;
};

} // namespace hotword::observability
