#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace surge {

// Gauges and counters published on /metrics in Prometheus text format.
class MetricsRegistry {
public:
  MetricsRegistry() = default;

  MetricsRegistry(const MetricsRegistry&) = delete;
  MetricsRegistry& operator=(const MetricsRegistry&) = delete;

  void set_network_speed(const std::string& interface_name, double mbps);
  void add_network_traffic(const std::string& interface_name, uint64_t bytes);
  // Replaces every top-talker series of the interface.
  void set_top_talkers(const std::string& interface_name,
                       const std::vector<std::pair<std::string, double>>& talkers);
  void set_threshold_exceeded(bool exceeded);

  double network_speed(const std::string& interface_name) const;
  uint64_t network_traffic(const std::string& interface_name) const;
  double threshold_exceeded() const;

  std::string render() const;

private:
  using LabelSet = std::vector<std::pair<std::string, std::string>>;

  static std::string format_labels(const LabelSet& labels);
  static std::string escape_label(const std::string& value);

  mutable std::mutex mutex_;
  std::map<std::string, double>   speed_mbps_;
  std::map<std::string, uint64_t> traffic_bytes_;
  std::map<std::string, std::map<std::string, double>> top_talkers_;
  double threshold_exceeded_ = 0.0;
};

}
