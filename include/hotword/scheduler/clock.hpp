#pragma once

#include <chrono>

namespace hotword::scheduler {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

class IClock {
public:
  virtual ~IClock() = default;
  [[nodiscard]] virtual TimePoint now() const = 0;
};

class SteadyClock final : public IClock {
public:
  [[nodiscard]] TimePoint now() const override { return Clock::now(); }
};

class ManualClock final : public IClock {
public:
  ManualClock() : now_(TimePoint{} + std::chrono::hours(1)) {}

  [[nodiscard]] TimePoint now() const override { return now_; }
  void set(TimePoint value) { now_ = value; }
  void advance(std::chrono::milliseconds delta) { now_ += delta; }

private:
  TimePoint now_;
};

} // namespace hotword::scheduler
