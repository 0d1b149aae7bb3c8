#include "hotword/scheduler/event_loop.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace hotword::scheduler {

EventLoop::EventLoop(TimerQueue &timers, const int input_fd)
    : timers_(timers), input_fd_(input_fd) {}

int EventLoop::poll_timeout_ms() const {
  const auto deadline = timers_.next_deadline();
  if (!deadline.has_value()) {
    return -1;
  }
  const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
      *deadline - timers_.clock().now());
  return static_cast<int>(std::clamp<long long>(remaining.count(), 0, 60'000));
}

int EventLoop::linger_timeout_ms() const {
  const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
      linger_until_ - timers_.clock().now());
  int timeout = static_cast<int>(std::clamp<long long>(remaining.count(), 0, 60'000));
  if (const int next_timer = poll_timeout_ms(); next_timer >= 0) {
    timeout = std::min(timeout, next_timer);
  }
  return timeout;
}

bool EventLoop::lingering() const {
  return timers_.pending() > 0 && timers_.clock().now() < linger_until_;
}

common::Status EventLoop::run() {
  running_ = true;
  while (running_) {
    if (!input_closed_) {
      pollfd fd{};
      fd.fd = input_fd_;
      fd.events = POLLIN;
      const int rc = ::poll(&fd, 1, poll_timeout_ms());
      if (rc < 0) {
        if (errno == EINTR) {
          continue;
        }
        running_ = false;
        return common::Status::error(std::string("poll failed: ") + std::strerror(errno));
      }
      if (rc > 0 && (fd.revents & (POLLIN | POLLHUP)) != 0) {
        auto status = read_input();
        if (!status.ok()) {
          running_ = false;
          return status;
        }
      }
    } else if (const int timeout = linger_timeout_ms(); timeout > 0) {
      if (::poll(nullptr, 0, timeout) < 0 && errno != EINTR) {
        running_ = false;
        return common::Status::error(std::string("poll failed: ") + std::strerror(errno));
      }
    }

    timers_.run_due();

    if (input_closed_ && !lingering()) {
      running_ = false;
    }
  }
  return common::Status::success();
}

common::Status EventLoop::read_input() {
  std::array<char, 4096> chunk{};
  const ssize_t n = ::read(input_fd_, chunk.data(), chunk.size());
  if (n < 0) {
    if (errno == EINTR || errno == EAGAIN) {
      return common::Status::success();
    }
    return common::Status::error(std::string("read failed: ") + std::strerror(errno));
  }
  if (n == 0) {
    input_closed_ = true;
    linger_until_ = timers_.clock().now() + linger_;
    if (!buffer_.empty()) {
      buffer_.push_back('\n');
      deliver_lines();
    }
    return common::Status::success();
  }
  buffer_.append(chunk.data(), static_cast<std::size_t>(n));
  deliver_lines();
  return common::Status::success();
}

void EventLoop::deliver_lines() {
  std::size_t newline = buffer_.find('\n');
  while (newline != std::string::npos) {
    std::string line = buffer_.substr(0, newline);
    buffer_.erase(0, newline + 1);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line_handler_) {
      line_handler_(line);
    }
    if (!running_) {
      return;
    }
    newline = buffer_.find('\n');
  }
}

} // namespace hotword::scheduler
