// tests/test_config.cpp
#include <iostream>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "config.hpp"

using namespace surge;

static const char* const ENV_VARS[] = {
  "NM_INTERFACE", "NM_PCAP_FILE", "NM_THRESHOLD_MBPS", "NM_WEBHOOK_URL",
  "NM_INTERVAL_SECONDS", "NM_TOP_N", "NM_METRICS_ENABLED", "NM_METRICS_PORT",
};

static void clear_env() {
  for (const char* name : ENV_VARS) {
    unsetenv(name);
  }
}

static std::string write_temp_config(const std::string& name, const std::string& content) {
  auto path = std::filesystem::temp_directory_path() / ("surge_test_" + name + ".json");
  std::ofstream out(path);
  out << content;
  return path.string();
}

static CliArgs parse(std::vector<std::string> words) {
  words.insert(words.begin(), "surge-monitor");
  std::vector<char*> argv;
  for (auto& w : words) argv.push_back(w.data());
  return parse_args(static_cast<int>(argv.size()), argv.data());
}

static const std::vector<std::string> NO_SEARCH_PATHS;

static int test_defaults() {
  clear_env();
  MonitorConfig cfg = load_config(CliArgs{}, NO_SEARCH_PATHS);

  if (!cfg.interface_name.empty() || cfg.threshold_mbps != 100.0 || !cfg.webhook_url.empty()) return 1;
  if (cfg.interval_seconds != 60 || cfg.top_n != 5) return 2;
  if (cfg.interval() != std::chrono::seconds(60)) return 3;
  if (!cfg.metrics_enabled || cfg.metrics_port != 9090) return 4;
  return 0;
}

static int test_file() {
  clear_env();
  std::string path = write_temp_config("file", R"({
    "interface": "eth_test",
    "threshold_mbps": 55.5,
    "webhook_url": "http://test.hook",
    "interval_seconds": 30,
    "top_n": 3
  })");

  CliArgs args;
  args.config_file = path;
  MonitorConfig cfg = load_config(args, NO_SEARCH_PATHS);

  if (cfg.config_file != path) return 10;
  if (cfg.interface_name != "eth_test" || cfg.threshold_mbps != 55.5) return 11;
  if (cfg.webhook_url != "http://test.hook") return 12;
  if (cfg.interval_seconds != 30 || cfg.top_n != 3) {
    std::cerr << "config: file values not applied\n";
    return 13;
  }

  // Search paths are used when no file is named explicitly.
  MonitorConfig searched = load_config(CliArgs{}, {"/nonexistent/surge.json", path});
  if (searched.config_file != path || searched.top_n != 3) return 14;

  std::filesystem::remove(path);
  return 0;
}

static int test_env() {
  clear_env();
  setenv("NM_INTERFACE", "env_iface", 1);
  setenv("NM_THRESHOLD_MBPS", "123.4", 1);
  setenv("NM_WEBHOOK_URL", "http://env.hook", 1);
  setenv("NM_INTERVAL_SECONDS", "15", 1);
  setenv("NM_TOP_N", "10", 1);
  setenv("NM_METRICS_ENABLED", "false", 1);

  MonitorConfig cfg = load_config(CliArgs{}, NO_SEARCH_PATHS);
  clear_env();

  if (cfg.interface_name != "env_iface" || cfg.threshold_mbps != 123.4) return 20;
  if (cfg.webhook_url != "http://env.hook") return 21;
  if (cfg.interval_seconds != 15 || cfg.top_n != 10 || cfg.metrics_enabled) {
    std::cerr << "config: environment values not applied\n";
    return 22;
  }
  return 0;
}

static int test_flags() {
  clear_env();
  CliArgs args = parse({"-i", "flag_iface", "--threshold_mbps", "99.9",
                        "--webhook_url", "http://flag.hook", "--interval-seconds", "5",
                        "--top_n", "2", "--no-metrics", "-r", "trace.pcap"});
  if (args.error || args.help || args.list_interfaces) return 30;

  MonitorConfig cfg = load_config(args, NO_SEARCH_PATHS);
  if (cfg.interface_name != "flag_iface" || cfg.threshold_mbps != 99.9) return 31;
  if (cfg.webhook_url != "http://flag.hook" || cfg.interval_seconds != 5 || cfg.top_n != 2) return 32;
  if (cfg.metrics_enabled || cfg.pcap_file != "trace.pcap") return 33;

  if (!parse({"--bogus"}).error) {
    std::cerr << "config: unknown flag must be reported\n";
    return 34;
  }
  if (!parse({"--top_n"}).error) return 35;
  if (!parse({"-h"}).help || !parse({"--list"}).list_interfaces) return 36;
  return 0;
}

// Flag > environment > file > default.
static int test_precedence() {
  clear_env();
  std::string path = write_temp_config("precedence", R"({
    "interface": "file_iface",
    "threshold_mbps": 50.0,
    "webhook_url": "http://file.hook",
    "interval_seconds": 600,
    "top_n": 1
  })");

  setenv("NM_INTERFACE", "env_iface", 1);
  setenv("NM_THRESHOLD_MBPS", "123.4", 1);
  setenv("NM_TOP_N", "10", 1);

  CliArgs args = parse({"--config", path, "--interface", "flag_iface",
                        "--webhook_url", "http://flag.hook"});
  MonitorConfig cfg = load_config(args, NO_SEARCH_PATHS);
  clear_env();
  std::filesystem::remove(path);

  if (cfg.interface_name != "flag_iface") return 40;
  if (cfg.threshold_mbps != 123.4) return 41;
  if (cfg.webhook_url != "http://flag.hook") return 42;
  if (cfg.interval_seconds != 600) return 43;
  if (cfg.top_n != 10) {
    std::cerr << "config: precedence order violated\n";
    return 44;
  }
  return 0;
}

static bool rejects(const CliArgs& args) {
  try {
    load_config(args, NO_SEARCH_PATHS);
  } catch (const ConfigError&) {
    return true;
  }
  return false;
}

static int test_validation() {
  clear_env();

  setenv("NM_INTERVAL_SECONDS", "0", 1);
  bool zero_interval = rejects(CliArgs{});
  clear_env();
  if (!zero_interval) {
    std::cerr << "config: zero interval must be rejected\n";
    return 50;
  }

  if (!rejects(parse({"--top_n", "-1"}))) return 51;
  if (!rejects(parse({"--threshold_mbps", "0"}))) return 52;
  if (!rejects(parse({"--threshold_mbps", "fast"}))) return 53;
  if (!rejects(parse({"--interval_seconds", "10s"}))) return 54;
  if (!rejects(parse({"--metrics_port", "70000"}))) return 55;
  if (!rejects(parse({"--config", "/nonexistent/surge-monitor.json"}))) return 56;

  std::string bad_type = write_temp_config("bad_type", R"({"interval_seconds": "ten"})");
  bool type_rejected = rejects(parse({"--config", bad_type}));
  std::filesystem::remove(bad_type);
  if (!type_rejected) return 57;

  std::string bad_json = write_temp_config("bad_json", "{ not json");
  bool json_rejected = rejects(parse({"--config", bad_json}));
  std::filesystem::remove(bad_json);
  if (!json_rejected) return 58;

  try {
    MonitorConfig cfg;
    cfg.top_n = 0;
    validate(cfg);
    return 59;
  } catch (const ConfigError&) {
  }
  return 0;
}

int main() {
  int rc = 0;
  if ((rc = test_defaults()) != 0) return rc;
  if ((rc = test_file()) != 0) return rc;
  if ((rc = test_env()) != 0) return rc;
  if ((rc = test_flags()) != 0) return rc;
  if ((rc = test_precedence()) != 0) return rc;
  if ((rc = test_validation()) != 0) return rc;

  std::cout << "test_config: OK\n";
  return 0;
}
