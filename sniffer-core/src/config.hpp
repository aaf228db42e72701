#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace surge {

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct MonitorConfig {
  std::string interface_name   = "";
  std::string pcap_file        = "";
  double      threshold_mbps   = 100.0;
  std::string webhook_url      = "";
  int         interval_seconds = 60;
  int         top_n            = 5;
  bool        metrics_enabled  = true;
  uint16_t    metrics_port     = 9090;
  std::string config_file      = "";

  std::chrono::seconds interval() const { return std::chrono::seconds(interval_seconds); }
};

struct CliArgs {
  // Setting values keyed like the config file ("threshold_mbps", ...).
  std::map<std::string, std::string> values;
  std::string config_file;
  bool list_interfaces = false;
  bool help            = false;
  bool error           = false;
};

CliArgs parse_args(int argc, char* argv[]);

// Layers defaults < config file < NM_* environment < flags, then validates.
// Throws ConfigError.
MonitorConfig load_config(const CliArgs& args);
MonitorConfig load_config(const CliArgs& args, const std::vector<std::string>& search_paths);

std::vector<std::string> default_config_paths();

void validate(const MonitorConfig& config);

}
