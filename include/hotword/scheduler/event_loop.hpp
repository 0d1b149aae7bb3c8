#pragma once

#include "hotword/common/result.hpp"
#include "hotword/scheduler/timer_queue.hpp"

#include <chrono>
#include <functional>
#include <string>

namespace hotword::scheduler {

class EventLoop {
public:
  using LineHandler = std::function<void(const std::string &line)>;

  EventLoop(TimerQueue &timers, int input_fd);

  void on_line(LineHandler handler) { line_handler_ = std::move(handler); }

  // After end of file, pending timers keep running for up to `linger`.
  void set_linger(std::chrono::milliseconds linger) { linger_ = linger; }

  // Returns when stop() is called, or at end of file once the linger window
  // closes or no timers remain.
  [[nodiscard]] common::Status run();
  void stop() { running_ = false; }
  [[nodiscard]] bool running() const { return running_; }

private:
  [[nodiscard]] int poll_timeout_ms() const;
  [[nodiscard]] int linger_timeout_ms() const;
  [[nodiscard]] bool lingering() const;
  [[nodiscard]] common::Status read_input();
  void deliver_lines();

  TimerQueue &timers_;
  int input_fd_ = -1;
  bool running_ = false;
  bool input_closed_ = false;
  std::chrono::milliseconds linger_{0};
  TimePoint linger_until_{};
  std::string buffer_;
  LineHandler line_handler_;
};

} // namespace hotword::scheduler
