#include "aggregator.hpp"
#include "frame_decoder.hpp"
#include "throughput.hpp"
#include <iostream>
#include <iomanip>
#include <algorithm>

namespace surge {

namespace {
constexpr std::chrono::seconds MAX_SHUTDOWN_GRACE{2};
}

Aggregator::Aggregator(std::chrono::milliseconds window, FrameChannel& source)
  : window_(window), source_(source) {

  if (window_.count() <= 0) {
    std::cerr << "[Surge] Warning: window duration must be positive, using 1s" << std::endl;
    window_ = std::chrono::seconds(1);
  }

  // Both loops block on channels; the stop signal has to wake them.
  stop_.on_trigger([this]() {
    source_.wake();
    results_.wake();
  });
}

Aggregator::~Aggregator() {
  stop();
  wait();
}

void Aggregator::start() {
  if (started_.exchange(true)) return;

  running_.store(true, std::memory_order_release);
  window_start_ = clock::now();

  std::cout << "[Surge] Aggregator started (window: "
            << window_.count() << "ms)" << std::endl;

  ingestion_thread_ = std::thread([this]() { run_ingestion(); });
  timer_thread_ = std::thread([this]() { run_window_timer(); });
}

void Aggregator::stop() {
  if (stop_.trigger()) {
    std::cout << "[Surge] Aggregator stop requested" << std::endl;
  }
}

void Aggregator::wait() {
  if (ingestion_thread_.joinable()) {
    ingestion_thread_.join();
  }
  if (timer_thread_.joinable()) {
    timer_thread_.join();
  }
}

void Aggregator::run_ingestion() {
  RawFrame frame;

  while (true) {
    ChannelStatus status = source_.pop(frame, stop_);

    if (status == ChannelStatus::Cancelled) {
      break;
    }
    if (status == ChannelStatus::Closed) {
      std::cout << "[Surge] Packet source closed" << std::endl;
      stop();
      break;
    }

    ingest(frame);
  }

  std::cout << "[Surge] Ingestion stopped (" << frames_accepted()
            << " frames counted, " << frames_skipped() << " skipped)" << std::endl;
  ingestion_done_.trigger();
}

void Aggregator::ingest(const RawFrame& frame) {
  auto info = decode_frame(frame);
  if (!info || info->length == 0) {
    frames_skipped_.fetch_add(1, std::memory_order_relaxed);
    return;
  }

  accumulator_.add(info->src_addr, info->length);
  frames_accepted_.fetch_add(1, std::memory_order_relaxed);
}

void Aggregator::run_window_timer() {
  auto next_tick = clock::now() + window_;

  while (!stop_.wait_until(next_tick)) {
    next_tick += window_;
    auto now = clock::now();
    if (next_tick <= now) {
      // Consumer fell behind by more than a window; skip the missed ticks.
      next_tick = now + window_;
    }

    publish(run_cycle(false));
  }

  // The last swap happens after ingestion exited so nothing lands behind it.
  ingestion_done_.wait();
  publish(run_cycle(true));

  results_.close();
  running_.store(false, std::memory_order_release);

  std::cout << "[Surge] Aggregator stopped (" << windows_emitted()
            << " windows emitted)" << std::endl;
}

WindowResult Aggregator::run_cycle(bool final_flush) {
  auto now = clock::now();

  WindowResult result;
  result.snapshot = accumulator_.swap_and_reset();
  result.total_bytes = total_bytes(result.snapshot);
  result.window = window_;
  result.elapsed = std::chrono::duration<double>(now - window_start_);
  result.rate_mbps = rate_mbps(result.total_bytes, result.window);
  result.final_flush = final_flush;
  window_start_ = now;

  std::cout << "[Surge] " << (final_flush ? "Final window" : "Window")
            << " finished. Total Bytes: " << result.total_bytes
            << ", Overall Speed: " << std::fixed << std::setprecision(2)
            << result.rate_mbps << " Mbps" << std::defaultfloat << std::endl;

  return result;
}

void Aggregator::publish(WindowResult&& result) {
  const bool final_flush = result.final_flush;

  ChannelStatus status = ChannelStatus::Cancelled;
  if (!final_flush) {
    status = results_.push(std::move(result), stop_);
  }

  if (status == ChannelStatus::Cancelled) {
    // Stopping: `result` is still intact, give the consumer a bounded chance.
    if (!grace_started_) {
      grace_deadline_ = clock::now() + std::min<clock::duration>(window_, MAX_SHUTDOWN_GRACE);
      grace_started_ = true;
    }
    status = results_.push_until(std::move(result), grace_deadline_);
  }

  if (status == ChannelStatus::Ok) {
    windows_emitted_.fetch_add(1, std::memory_order_relaxed);
    return;
  }

  results_dropped_.fetch_add(1, std::memory_order_relaxed);
  std::cerr << "[Surge] Aggregator stopping, discarding "
            << (final_flush ? "final" : "pending") << " window result" << std::endl;
}

}
