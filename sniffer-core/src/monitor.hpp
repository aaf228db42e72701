#pragma once

#include "aggregator.hpp"
#include "config.hpp"
#include "metrics_registry.hpp"
#include "notifier.hpp"
#include <atomic>
#include <string>
#include <vector>

namespace surge {

struct WindowReport {
  uint64_t            total_bytes  = 0;
  double              overall_mbps = 0.0;
  bool                exceeded     = false;
  std::vector<Talker> top_talkers;
};

// Consumes window results: threshold check, metrics, notifications.
class Monitor {
public:
  // metrics and notifier may be null.
  Monitor(const MonitorConfig& config, std::string interface_label,
          Aggregator::ResultChannel& results,
          MetricsRegistry* metrics, Notifier* notifier);

  Monitor(const Monitor&) = delete;
  Monitor& operator=(const Monitor&) = delete;

  // Returns once the result channel is closed and drained.
  void run();

  WindowReport process_window(const WindowResult& result);

  uint64_t windows_processed() const { return windows_processed_.load(std::memory_order_relaxed); }
  uint64_t alerts_raised() const { return alerts_raised_.load(std::memory_order_relaxed); }

private:
  MonitorConfig              config_;
  std::string                interface_label_;
  Aggregator::ResultChannel& results_;
  MetricsRegistry*           metrics_;
  Notifier*                  notifier_;

  std::atomic<uint64_t> windows_processed_{0};
  std::atomic<uint64_t> alerts_raised_{0};
};

}
