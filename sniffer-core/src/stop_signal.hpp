#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <vector>

namespace surge {

// One-shot cancellation flag shared by the capture, ingestion and window
// loops. Triggering it more than once is harmless.
class StopSignal {
public:
  using Listener = std::function<void()>;

  StopSignal() = default;

  StopSignal(const StopSignal&) = delete;
  StopSignal& operator=(const StopSignal&) = delete;

  // Returns true only for the call that flipped the flag.
  bool trigger() {
    std::vector<Listener> listeners;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (triggered_.load(std::memory_order_acquire)) return false;
      triggered_.store(true, std::memory_order_release);
      listeners.swap(listeners_);
    }
    cv_.notify_all();

    // Run outside the lock: listeners wake other condition variables.
    for (auto& listener : listeners) {
      listener();
    }
    return true;
  }

  bool triggered() const { return triggered_.load(std::memory_order_acquire); }

  void on_trigger(Listener listener) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!triggered_.load(std::memory_order_acquire)) {
        listeners_.push_back(std::move(listener));
        return;
      }
    }
    listener();
  }

  void wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return triggered_.load(std::memory_order_acquire); });
  }

  // Returns true if the signal fired before the deadline.
  template <typename Clock, typename Duration>
  bool wait_until(const std::chrono::time_point<Clock, Duration>& deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_until(lock, deadline, [this] {
      return triggered_.load(std::memory_order_acquire);
    });
  }

  template <typename Rep, typename Period>
  bool wait_for(const std::chrono::duration<Rep, Period>& timeout) {
    return wait_until(std::chrono::steady_clock::now() + timeout);
  }

private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::atomic<bool>       triggered_{false};
  std::vector<Listener>   listeners_;
};

}
