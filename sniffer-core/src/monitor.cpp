#include "monitor.hpp"
#include "throughput.hpp"
#include <cstdio>
#include <iostream>
#include <utility>

namespace surge {

Monitor::Monitor(const MonitorConfig& config, std::string interface_label,
                 Aggregator::ResultChannel& results,
                 MetricsRegistry* metrics, Notifier* notifier)
  : config_(config),
    interface_label_(std::move(interface_label)),
    results_(results),
    metrics_(metrics),
    notifier_(notifier) {}

void Monitor::run() {
  std::cout << "[Surge] Starting monitoring loop..." << std::endl;

  WindowResult result;
  while (results_.pop(result)) {
    process_window(result);
  }

  std::cout << "[Surge] Aggregator results channel closed. Monitor stopping." << std::endl;
}

WindowReport Monitor::process_window(const WindowResult& result) {
  WindowReport report;
  report.total_bytes = result.total_bytes;
  report.overall_mbps = rate_mbps(result.total_bytes, result.window);
  report.exceeded = report.overall_mbps > config_.threshold_mbps;
  report.top_talkers = top_talkers(result.snapshot, static_cast<size_t>(config_.top_n),
                                   result.window);

  char line[160];
  std::snprintf(line, sizeof(line),
                "Interval Check: Duration=%.2fs, Total Bytes=%llu, Overall Speed=%.2f Mbps",
                result.window.count(),
                static_cast<unsigned long long>(result.total_bytes),
                report.overall_mbps);
  std::cout << "[Surge] " << line << std::endl;

  if (metrics_) {
    std::vector<std::pair<std::string, double>> speeds;
    speeds.reserve(result.snapshot.size());
    for (const auto& entry : result.snapshot) {
      speeds.emplace_back(entry.address, rate_mbps(entry.bytes, result.window));
    }

    metrics_->set_network_speed(interface_label_, report.overall_mbps);
    metrics_->add_network_traffic(interface_label_, result.total_bytes);
    metrics_->set_top_talkers(interface_label_, speeds);
    metrics_->set_threshold_exceeded(report.exceeded);
  }

  if (report.exceeded) {
    alerts_raised_.fetch_add(1, std::memory_order_relaxed);

    std::snprintf(line, sizeof(line),
                  "ALERT: Network speed threshold exceeded! Current: %.2f Mbps, Threshold: %.2f Mbps",
                  report.overall_mbps, config_.threshold_mbps);
    std::cerr << "[Surge] " << line << std::endl;

    if (notifier_) {
      ThresholdAlert alert;
      alert.interface_name = interface_label_;
      alert.threshold_mbps = config_.threshold_mbps;
      alert.overall_mbps = report.overall_mbps;
      alert.interval_seconds = config_.interval_seconds;
      alert.top_talkers = report.top_talkers;
      notifier_->notify_threshold(alert);
    }
  }

  windows_processed_.fetch_add(1, std::memory_order_relaxed);
  return report;
}

}
