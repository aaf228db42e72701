#pragma once

#include "stop_signal.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace surge {

enum class ChannelStatus {
  Ok,
  Full,
  Closed,
  Cancelled
};

// Bounded FIFO hand-off between threads. Closing it lets consumers drain
// what is queued and then observe end-of-stream.
//
// The cancellable overloads only notice a StopSignal while blocked if the
// owner of that signal calls wake() from a StopSignal listener.
template <typename T>
class Channel {
public:
  explicit Channel(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

  Channel(const Channel&) = delete;
  Channel& operator=(const Channel&) = delete;

  bool push(T item) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this] { return queue_.size() < capacity_ || closed_; });
    if (closed_) return false;
    queue_.push_back(std::move(item));
    not_empty_.notify_one();
    return true;
  }

  // `item` is only moved from when the status is Ok.
  ChannelStatus push(T&& item, const StopSignal& cancel) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [&] {
      return queue_.size() < capacity_ || closed_ || cancel.triggered();
    });
    if (closed_) return ChannelStatus::Closed;
    if (queue_.size() >= capacity_) return ChannelStatus::Cancelled;
    queue_.push_back(std::move(item));
    not_empty_.notify_one();
    return ChannelStatus::Ok;
  }

  template <typename Clock, typename Duration>
  ChannelStatus push_until(T&& item, const std::chrono::time_point<Clock, Duration>& deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    bool ready = not_full_.wait_until(lock, deadline, [this] {
      return queue_.size() < capacity_ || closed_;
    });
    if (!ready) return ChannelStatus::Full;
    if (closed_) return ChannelStatus::Closed;
    queue_.push_back(std::move(item));
    not_empty_.notify_one();
    return ChannelStatus::Ok;
  }

  ChannelStatus try_push(T item) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return ChannelStatus::Closed;
    if (queue_.size() >= capacity_) return ChannelStatus::Full;
    queue_.push_back(std::move(item));
    not_empty_.notify_one();
    return ChannelStatus::Ok;
  }

  // Returns false once the channel is closed and drained.
  bool pop(T& out) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) return false;
    out = std::move(queue_.front());
    queue_.pop_front();
    not_full_.notify_one();
    return true;
  }

  // Cancellation wins over queued items.
  ChannelStatus pop(T& out, const StopSignal& cancel) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [&] {
      return !queue_.empty() || closed_ || cancel.triggered();
    });
    if (cancel.triggered()) return ChannelStatus::Cancelled;
    if (queue_.empty()) return ChannelStatus::Closed;
    out = std::move(queue_.front());
    queue_.pop_front();
    not_full_.notify_one();
    return ChannelStatus::Ok;
  }

  void close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  // Re-evaluates blocked waiters, e.g. after a StopSignal fired.
  void wake() {
    std::lock_guard<std::mutex> lock(mutex_);
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  float fill_ratio() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<float>(queue_.size()) / static_cast<float>(capacity_);
  }

private:
  const size_t            capacity_;
  mutable std::mutex      mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T>           queue_;
  bool                    closed_ = false;
};

}
