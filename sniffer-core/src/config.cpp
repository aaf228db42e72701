#include "config.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>

namespace surge {

namespace {

const char* const SETTING_KEYS[] = {
  "interface",
  "pcap_file",
  "threshold_mbps",
  "webhook_url",
  "interval_seconds",
  "top_n",
  "metrics_enabled",
  "metrics_port",
};

const char* const ENV_PREFIX = "NM_";

bool is_setting_key(const std::string& key) {
  return std::find(std::begin(SETTING_KEYS), std::end(SETTING_KEYS), key) != std::end(SETTING_KEYS);
}

double parse_double(const std::string& key, const std::string& text) {
  try {
    size_t used = 0;
    double v = std::stod(text, &used);
    if (used != text.size()) throw std::invalid_argument(key);
    return v;
  } catch (const std::logic_error&) {
    throw ConfigError("invalid number for " + key + ": '" + text + "'");
  }
}

long parse_integer(const std::string& key, const std::string& text) {
  try {
    size_t used = 0;
    long v = std::stol(text, &used);
    if (used != text.size()) throw std::invalid_argument(key);
    return v;
  } catch (const std::logic_error&) {
    throw ConfigError("invalid integer for " + key + ": '" + text + "'");
  }
}

bool parse_bool(const std::string& key, std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (text == "true" || text == "1" || text == "yes" || text == "on") return true;
  if (text == "false" || text == "0" || text == "no" || text == "off") return false;
  throw ConfigError("invalid boolean for " + key + ": '" + text + "'");
}

uint16_t to_port(long port) {
  if (port < 1 || port > 65535) {
    throw ConfigError("metrics_port must be between 1 and 65535");
  }
  return static_cast<uint16_t>(port);
}

int to_int(const std::string& key, long v) {
  if (v > std::numeric_limits<int>::max() || v < std::numeric_limits<int>::min()) {
    throw ConfigError(key + " is out of range");
  }
  return static_cast<int>(v);
}

void apply_text(MonitorConfig& config, const std::string& key, const std::string& value) {
  if (key == "interface") {
    config.interface_name = value;
  } else if (key == "pcap_file") {
    config.pcap_file = value;
  } else if (key == "threshold_mbps") {
    config.threshold_mbps = parse_double(key, value);
  } else if (key == "webhook_url") {
    config.webhook_url = value;
  } else if (key == "interval_seconds") {
    config.interval_seconds = to_int(key, parse_integer(key, value));
  } else if (key == "top_n") {
    config.top_n = to_int(key, parse_integer(key, value));
  } else if (key == "metrics_enabled") {
    config.metrics_enabled = parse_bool(key, value);
  } else if (key == "metrics_port") {
    config.metrics_port = to_port(parse_integer(key, value));
  } else {
    throw ConfigError("unknown setting: " + key);
  }
}

void apply_json(MonitorConfig& config, const nlohmann::json& j) {
  if (!j.is_object()) {
    throw ConfigError("config file must contain a JSON object");
  }

  for (auto it = j.begin(); it != j.end(); ++it) {
    const std::string& key = it.key();
    const nlohmann::json& value = it.value();

    if (!is_setting_key(key)) {
      std::cerr << "[Surge] Warning: ignoring unknown config key '" << key << "'" << std::endl;
      continue;
    }

    try {
      if (key == "interface") {
        config.interface_name = value.get<std::string>();
      } else if (key == "pcap_file") {
        config.pcap_file = value.get<std::string>();
      } else if (key == "threshold_mbps") {
        config.threshold_mbps = value.get<double>();
      } else if (key == "webhook_url") {
        config.webhook_url = value.get<std::string>();
      } else if (key == "interval_seconds") {
        if (!value.is_number_integer()) throw ConfigError("interval_seconds must be an integer");
        config.interval_seconds = to_int(key, value.get<long>());
      } else if (key == "top_n") {
        if (!value.is_number_integer()) throw ConfigError("top_n must be an integer");
        config.top_n = to_int(key, value.get<long>());
      } else if (key == "metrics_enabled") {
        config.metrics_enabled = value.get<bool>();
      } else if (key == "metrics_port") {
        if (!value.is_number_integer()) throw ConfigError("metrics_port must be an integer");
        config.metrics_port = to_port(value.get<long>());
      }
    } catch (const nlohmann::json::type_error& e) {
      throw ConfigError("invalid type for " + key + ": " + e.what());
    }
  }
}

std::string find_config_file(const std::string& explicit_path,
                             const std::vector<std::string>& search_paths) {
  if (!explicit_path.empty()) {
    std::ifstream probe(explicit_path);
    if (!probe) {
      throw ConfigError("config file specified but not found: " + explicit_path);
    }
    return explicit_path;
  }

  for (const auto& path : search_paths) {
    std::ifstream probe(path);
    if (probe) return path;
  }
  return "";
}

nlohmann::json read_config_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("failed to open config file: " + path);
  }
  try {
    return nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("failed to read config file " + path + ": " + e.what());
  }
}

std::string env_name(const std::string& key) {
  std::string name = ENV_PREFIX;
  for (char c : key) {
    name += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return name;
}

std::string normalize_flag(std::string name) {
  std::replace(name.begin(), name.end(), '-', '_');
  return name;
}

}

CliArgs parse_args(int argc, char* argv[]) {
  CliArgs args;

  auto take_value = [&](int& i, const std::string& arg) -> const char* {
    if (i + 1 < argc) return argv[++i];
    std::cerr << "Error: " << arg << " requires a value" << std::endl;
    args.error = true;
    return nullptr;
  };

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      args.help = true;
    }
    else if (arg == "-l" || arg == "--list") {
      args.list_interfaces = true;
    }
    else if (arg == "-c" || arg == "--config") {
      if (const char* v = take_value(i, arg)) args.config_file = v;
    }
    else if (arg == "-i" || arg == "--interface") {
      if (const char* v = take_value(i, arg)) args.values["interface"] = v;
    }
    else if (arg == "-r" || arg == "--read") {
      if (const char* v = take_value(i, arg)) args.values["pcap_file"] = v;
    }
    else if (arg == "--no-metrics") {
      args.values["metrics_enabled"] = "false";
    }
    else if (arg.rfind("--", 0) == 0 && is_setting_key(normalize_flag(arg.substr(2)))) {
      const std::string key = normalize_flag(arg.substr(2));
      if (const char* v = take_value(i, arg)) args.values[key] = v;
    }
    else {
      std::cerr << "Unknown argument: " << arg << std::endl;
      args.error = true;
    }
  }

  return args;
}

std::vector<std::string> default_config_paths() {
  std::vector<std::string> paths;
  paths.push_back("/etc/surge-monitor/config.json");
  if (const char* home = std::getenv("HOME")) {
    paths.push_back(std::string(home) + "/.config/surge-monitor/config.json");
  }
  paths.push_back("config.json");
  return paths;
}

MonitorConfig load_config(const CliArgs& args) {
  return load_config(args, default_config_paths());
}

MonitorConfig load_config(const CliArgs& args, const std::vector<std::string>& search_paths) {
  MonitorConfig config;

  const std::string path = find_config_file(args.config_file, search_paths);
  if (!path.empty()) {
    apply_json(config, read_config_file(path));
    config.config_file = path;
    std::cout << "[Surge] Using config file: " << path << std::endl;
  }

  for (const char* key : SETTING_KEYS) {
    if (const char* value = std::getenv(env_name(key).c_str())) {
      apply_text(config, key, value);
    }
  }

  for (const auto& [key, value] : args.values) {
    apply_text(config, key, value);
  }

  validate(config);

  if (config.webhook_url.empty()) {
    std::cerr << "[Surge] Warning: webhook URL is not set. Notifications will not be sent."
              << std::endl;
  }

  return config;
}

void validate(const MonitorConfig& config) {
  if (config.interval_seconds <= 0) {
    throw ConfigError("interval_seconds must be positive");
  }
  if (config.top_n <= 0) {
    throw ConfigError("top_n must be positive");
  }
  if (!(config.threshold_mbps > 0)) {
    throw ConfigError("threshold_mbps must be positive");
  }
  if (config.metrics_enabled && config.metrics_port == 0) {
    throw ConfigError("metrics_port must be between 1 and 65535");
  }
}

}
