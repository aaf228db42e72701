#include "metrics_registry.hpp"
#include <iomanip>
#include <sstream>

namespace surge {

void MetricsRegistry::set_network_speed(const std::string& interface_name, double mbps) {
  std::lock_guard<std::mutex> lock(mutex_);
  speed_mbps_[interface_name] = mbps;
}

void MetricsRegistry::add_network_traffic(const std::string& interface_name, uint64_t bytes) {
  std::lock_guard<std::mutex> lock(mutex_);
  traffic_bytes_[interface_name] += bytes;
}

void MetricsRegistry::set_top_talkers(
  const std::string& interface_name,
  const std::vector<std::pair<std::string, double>>& talkers
) {
  std::map<std::string, double> series;
  for (const auto& [address, mbps] : talkers) {
    series[address] = mbps;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  top_talkers_[interface_name] = std::move(series);
}

void MetricsRegistry::set_threshold_exceeded(bool exceeded) {
  std::lock_guard<std::mutex> lock(mutex_);
  threshold_exceeded_ = exceeded ? 1.0 : 0.0;
}

double MetricsRegistry::network_speed(const std::string& interface_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = speed_mbps_.find(interface_name);
  return it != speed_mbps_.end() ? it->second : 0.0;
}

uint64_t MetricsRegistry::network_traffic(const std::string& interface_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = traffic_bytes_.find(interface_name);
  return it != traffic_bytes_.end() ? it->second : 0;
}

double MetricsRegistry::threshold_exceeded() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return threshold_exceeded_;
}

std::string MetricsRegistry::render() const {
  std::ostringstream out;
  out << std::setprecision(15);

  std::lock_guard<std::mutex> lock(mutex_);

  out << "# HELP network_speed_mbps Current network speed in Mbps\n"
      << "# TYPE network_speed_mbps gauge\n";
  for (const auto& [iface, mbps] : speed_mbps_) {
    out << "network_speed_mbps" << format_labels({{"interface", iface}, {"direction", "total"}})
        << ' ' << mbps << '\n';
  }

  out << "# HELP network_traffic_bytes_total Total network traffic in bytes\n"
      << "# TYPE network_traffic_bytes_total counter\n";
  for (const auto& [iface, bytes] : traffic_bytes_) {
    out << "network_traffic_bytes_total" << format_labels({{"interface", iface}, {"direction", "total"}})
        << ' ' << bytes << '\n';
  }

  out << "# HELP network_top_talkers_mbps Top network talkers by speed in Mbps\n"
      << "# TYPE network_top_talkers_mbps gauge\n";
  for (const auto& [iface, series] : top_talkers_) {
    for (const auto& [address, mbps] : series) {
      out << "network_top_talkers_mbps" << format_labels({{"interface", iface}, {"ip_address", address}})
          << ' ' << mbps << '\n';
    }
  }

  out << "# HELP network_threshold_exceeded Whether the network speed threshold is exceeded (1 for yes, 0 for no)\n"
      << "# TYPE network_threshold_exceeded gauge\n"
      << "network_threshold_exceeded " << threshold_exceeded_ << '\n';

  return out.str();
}

std::string MetricsRegistry::format_labels(const LabelSet& labels) {
  std::string text = "{";
  for (size_t i = 0; i < labels.size(); i++) {
    if (i > 0) text += ',';
    text += labels[i].first;
    text += "=\"";
    text += escape_label(labels[i].second);
    text += '"';
  }
  text += '}';
  return text;
}

std::string MetricsRegistry::escape_label(const std::string& value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (char c : value) {
    switch (c) {
      case '\\': escaped += "\\\\"; break;
      case '"':  escaped += "\\\""; break;
      case '\n': escaped += "\\n"; break;
      default:   escaped += c; break;
    }
  }
  return escaped;
}

}
