#pragma once

#include "traffic.hpp"
#include "channel.hpp"
#include "stop_signal.hpp"
#include "window_accumulator.hpp"
#include <atomic>
#include <chrono>
#include <thread>

namespace surge {

// Runs the ingestion loop and the window timer loop against one shared
// WindowAccumulator and publishes one WindowResult per window.
//
// Result delivery: the result channel holds a single result. A regular
// window waits for that slot for as long as the aggregator runs. Once the
// stop signal fired, a pending result and the final flush get a shared
// grace period of min(window, 2s) to be taken; whatever still does not fit
// is discarded and counted in results_dropped(). The channel is closed
// right after the final flush, so consumers see end-of-stream once they
// drained it.
class Aggregator {
public:
  using FrameChannel  = Channel<RawFrame>;
  using ResultChannel = Channel<WindowResult>;

  Aggregator(std::chrono::milliseconds window, FrameChannel& source);
  ~Aggregator();

  Aggregator(const Aggregator&) = delete;
  Aggregator& operator=(const Aggregator&) = delete;

  void start();
  // Idempotent; also triggered by the ingestion loop when the source closes.
  void stop();
  // Blocks until both loops have returned.
  void wait();

  bool is_running() const { return running_.load(std::memory_order_acquire); }
  ResultChannel& results() { return results_; }
  StopSignal& stop_signal() { return stop_; }

  uint64_t frames_accepted() const { return frames_accepted_.load(std::memory_order_relaxed); }
  uint64_t frames_skipped() const { return frames_skipped_.load(std::memory_order_relaxed); }
  uint64_t windows_emitted() const { return windows_emitted_.load(std::memory_order_relaxed); }
  uint64_t results_dropped() const { return results_dropped_.load(std::memory_order_relaxed); }

private:
  void run_ingestion();
  void run_window_timer();
  void ingest(const RawFrame& frame);
  WindowResult run_cycle(bool final_flush);
  void publish(WindowResult&& result);

  using clock = std::chrono::steady_clock;

  std::chrono::milliseconds window_;
  FrameChannel&             source_;
  WindowAccumulator         accumulator_;
  ResultChannel             results_{1};
  StopSignal                stop_;
  StopSignal                ingestion_done_;

  std::thread               ingestion_thread_;
  std::thread               timer_thread_;
  std::atomic<bool>         started_{false};
  std::atomic<bool>         running_{false};
  clock::time_point         window_start_;
  clock::time_point         grace_deadline_;
  bool                      grace_started_ = false;

  std::atomic<uint64_t> frames_accepted_{0};
  std::atomic<uint64_t> frames_skipped_{0};
  std::atomic<uint64_t> windows_emitted_{0};
  std::atomic<uint64_t> results_dropped_{0};
};

}
