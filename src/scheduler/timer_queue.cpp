#include "hotword/scheduler/timer_queue.hpp"

#include <algorithm>

namespace hotword::scheduler {

TimerQueue::TimerQueue(const IClock &clock) : clock_(clock) {}

TimerId TimerQueue::schedule_after(const std::chrono::milliseconds delay,
                                   std::function<void()> task) {
  const TimerId id = next_id_++;
  timers_.emplace(id, Timer{.deadline = clock_.now() + std::max(delay, std::chrono::milliseconds(0)),
                            .interval = std::chrono::milliseconds(0),
                            .task = std::move(task)});
  return id;
}

TimerId TimerQueue::schedule_every(const std::chrono::milliseconds interval,
                                   std::function<void()> task) {
  if (interval.count() <= 0) {
    return INVALID_TIMER;
  }
  const TimerId id = next_id_++;
  timers_.emplace(id, Timer{.deadline = clock_.now() + interval,
                            .interval = interval,
                            .task = std::move(task)});
  return id;
}

bool TimerQueue::cancel(const TimerId id) {
  if (id == INVALID_TIMER) {
    return false;
  }
  return timers_.erase(id) > 0;
}

void TimerQueue::cancel_all() { timers_.clear(); }

bool TimerQueue::is_pending(const TimerId id) const { return timers_.contains(id); }

std::optional<TimePoint> TimerQueue::next_deadline() const {
  std::optional<TimePoint> earliest;
  for (const auto &[id, timer] : timers_) {
    if (!earliest.has_value() || timer.deadline < *earliest) {
      earliest = timer.deadline;
    }
  }
  return earliest;
}

std::map<TimerId, TimerQueue::Timer>::iterator TimerQueue::earliest_due(const TimePoint now,
                                                                      const TimerId id_limit) {
  auto best = timers_.end();
  for (auto it = timers_.begin(); it != timers_.end() && it->first < id_limit; ++it) {
    if (it->second.deadline > now) {
      continue;
    }
    if (best == timers_.end() || it->second.deadline < best->second.deadline) {
      best = it;
    }
  }
  return best;
}

std::size_t TimerQueue::run_due() {
  const TimePoint now = clock_.now();
  // Timers added by the tasks below wait for the next pass.
  const TimerId id_limit = next_id_;
  std::size_t ran = 0;

  while (true) {
    auto it = earliest_due(now, id_limit);
    if (it == timers_.end()) {
      break;
    }

    std::function<void()> task;
    if (it->second.interval.count() > 0) {
      task = it->second.task;
      auto next = it->second.deadline + it->second.interval;
      if (next <= now) {
        next = now + it->second.interval;
      }
      it->second.deadline = next;
    } else {
      task = std::move(it->second.task);
      timers_.erase(it);
    }

    ++ran;
    if (task) {
      task();
    }
  }
  return ran;
}

} // namespace hotword::scheduler
