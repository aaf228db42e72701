#pragma once

#include "notifier.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>

namespace surge {

constexpr int ALERT_COLOR_RED   = 15158332;
constexpr int ALERT_COLOR_BLUE  = 3447003;
constexpr const char* WEBHOOK_USERNAME = "Network Monitor";

inline std::string rfc3339_utc(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm utc{};
  gmtime_r(&t, &utc);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return buf;
}

inline std::string format_fixed2(double v) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.2f", v);
  return buf;
}

inline nlohmann::json threshold_alert_to_json(const ThresholdAlert& alert,
                                              const std::string& timestamp) {
  nlohmann::json fields = nlohmann::json::array();
  double listed_mbps = 0.0;
  for (const auto& talker : alert.top_talkers) {
    fields.push_back({
      {"name", talker.address},
      {"value", format_fixed2(talker.rate_mbps) + " Mbps"},
      {"inline", true}
    });
    listed_mbps += talker.rate_mbps;
  }

  std::string description =
    "Overall speed exceeded " + format_fixed2(alert.threshold_mbps) +
    " Mbps threshold (Total: " + format_fixed2(listed_mbps) +
    " Mbps) in the last " + std::to_string(alert.interval_seconds) +
    " seconds.\nTop " + std::to_string(alert.top_talkers.size()) + " talkers:";

  nlohmann::json embed = {
    {"title", "🚨 Network Threshold Exceeded!"},
    {"description", description},
    {"color", ALERT_COLOR_RED},
    {"fields", fields},
    {"timestamp", timestamp}
  };

  nlohmann::json j;
  j["username"] = WEBHOOK_USERNAME;
  j["embeds"] = nlohmann::json::array({embed});
  return j;
}

inline nlohmann::json startup_to_json(const std::string& interface_name,
                                      double threshold_mbps, int interval_seconds,
                                      const std::string& timestamp) {
  const std::string shown = interface_name.empty() ? "Auto-Selected" : interface_name;

  std::string description =
    "Network Monitor started.\nMonitoring Interface: **" + shown +
    "**\nThreshold: **" + format_fixed2(threshold_mbps) +
    " Mbps**\nCheck Interval: **" + std::to_string(interval_seconds) + "s**";

  nlohmann::json embed = {
    {"title", "🚀 Monitor Initialized"},
    {"description", description},
    {"color", ALERT_COLOR_BLUE},
    {"timestamp", timestamp}
  };

  nlohmann::json j;
  j["username"] = WEBHOOK_USERNAME;
  j["embeds"] = nlohmann::json::array({embed});
  return j;
}

}
