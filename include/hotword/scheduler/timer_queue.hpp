#pragma once

#include "hotword/scheduler/clock.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>

namespace hotword::scheduler {

using TimerId = std::uint64_t;
inline constexpr TimerId INVALID_TIMER = 0;

// A timer cancelled by an earlier task of the same run_due() pass never runs.
class TimerQueue {
public:
  explicit TimerQueue(const IClock &clock);

  TimerQueue(const TimerQueue &) = delete;
  TimerQueue &operator=(const TimerQueue &) = delete;

  [[nodiscard]] TimerId schedule_after(std::chrono::milliseconds delay,
                                       std::function<void()> task);
  [[nodiscard]] TimerId schedule_every(std::chrono::milliseconds interval,
                                       std::function<void()> task);
  bool cancel(TimerId id);
  void cancel_all();

  // Returns the number of tasks that ran.
  std::size_t run_due();

  [[nodiscard]] std::optional<TimePoint> next_deadline() const;
  [[nodiscard]] bool is_pending(TimerId id) const;
  [[nodiscard]] std::size_t pending() const { return timers_.size(); }
  [[nodiscard]] const IClock &clock() const { return clock_; }

private:
  struct Timer {
    TimePoint deadline;
    std::chrono::milliseconds interval{0};
    std::function<void()> task;
  };

  [[nodiscard]] std::map<TimerId, Timer>::iterator earliest_due(TimePoint now, TimerId id_limit);

  const IClock &clock_;
  std::map<TimerId, Timer> timers_;
  TimerId next_id_ = 1;
};

} // namespace hotword::scheduler
