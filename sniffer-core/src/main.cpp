#include "capture.hpp"
#include "aggregator.hpp"
#include "config.hpp"
#include "metrics_registry.hpp"
#include "metrics_server.hpp"
#include "monitor.hpp"
#include "notifier.hpp"

#include <iostream>
#include <thread>
#include <csignal>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int signum) {
  (void)signum;
  g_shutdown.store(true, std::memory_order_release);
}

static void print_help() {
  std::cout << R"(
Usage: surge-monitor [options]

Watches an interface, totals bytes per source address over fixed windows
and alerts when the aggregate rate crosses a threshold.

Options:
  -c, --config <path>        JSON config file
                             (default search: /etc/surge-monitor/config.json,
                              ~/.config/surge-monitor/config.json, ./config.json)
  -i, --interface <name>     Network interface (default: first non-loopback
                             interface with addresses)
  -r, --read <file.pcap>     Replay a capture file instead of a live interface
      --threshold_mbps <x>   Alert threshold in Mbps (default: 100)
      --interval_seconds <n> Window length in seconds (default: 60)
      --top_n <n>            Top talkers to report (default: 5)
      --webhook_url <url>    Discord webhook for alerts
      --metrics_port <port>  Prometheus port (default: 9090)
      --no-metrics           Disable the /metrics endpoint
  -l, --list                 List available network interfaces
  -h, --help                 Show this help

Every setting can also come from the environment with an NM_ prefix,
e.g. NM_THRESHOLD_MBPS=250. Flags override the environment, which
overrides the config file.

Notes:
  - Live capture needs cap_net_raw,cap_net_admin (or sudo)
)" << std::endl;
}

static void print_interfaces() {
  auto interfaces = surge::CaptureEngine::list_interfaces();

  if (interfaces.empty()) {
    std::cerr << "No network interfaces found." << std::endl;
    std::cerr << "Ensure you have proper permissions and pcap is installed." << std::endl;
    return;
  }

  std::cout << "\nAvailable network interfaces:\n" << std::endl;
  std::cout << "  # | Name                     | Status    | Addr | Description" << std::endl;

  int idx = 1;
  for (const auto& iface : interfaces) {
    std::cout << "  " << idx++ << " | ";

    std::string name = iface.name;
    if (name.length() > 24) name = name.substr(0, 21) + "...";
    std::cout << name;
    for (size_t i = name.length(); i < 24; i++) std::cout << ' ';

    std::cout << " | ";

    if (iface.is_loopback) {
      std::cout << "loopback ";
    } else if (iface.is_up) {
      std::cout << "UP       ";
    } else {
      std::cout << "down     ";
    }

    std::cout << " | ";
    std::cout << (iface.has_addresses ? "yes " : "no  ");
    std::cout << " | ";
    std::cout << iface.description;
    std::cout << std::endl;
  }

  std::cout << "\nUse -i <name> to select an interface." << std::endl;
}

int main(int argc, char* argv[]) {
  auto args = surge::parse_args(argc, argv);

  if (args.help || args.error) {
    print_help();
    return args.error ? 1 : 0;
  }

  if (args.list_interfaces) {
    print_interfaces();
    return 0;
  }

  surge::MonitorConfig config;
  try {
    config = surge::load_config(args);
  } catch (const surge::ConfigError& e) {
    std::cerr << "[Surge] Configuration error: " << e.what() << std::endl;
    return 1;
  }

  std::cout << "[Surge] Starting network monitor..." << std::endl;

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  surge::CaptureEngine::FrameChannel frames(8192);
  surge::CaptureEngine capture(config, frames);

  if (!capture.open()) {
    std::cerr << "[Surge] Failed to start capture. Exiting." << std::endl;
    return 1;
  }

  const std::string interface_label =
    config.interface_name.empty() && config.pcap_file.empty() ? "Auto-Selected" : capture.interface_name();

  std::cout << "[Surge] Monitor initialized. Interface: " << capture.interface_name()
            << ", Threshold: " << config.threshold_mbps
            << " Mbps, Interval: " << config.interval_seconds
            << "s, TopN: " << config.top_n << std::endl;

  surge::MetricsRegistry registry;
  std::unique_ptr<surge::MetricsServer> metrics_server;
  if (config.metrics_enabled) {
    metrics_server = std::make_unique<surge::MetricsServer>(config.metrics_port, registry);
    if (!metrics_server->start()) {
      std::cerr << "[Surge] Failed to start metrics server. Exiting." << std::endl;
      return 1;
    }
  }

  std::unique_ptr<surge::DiscordNotifier> notifier;
  if (!config.webhook_url.empty()) {
    notifier = std::make_unique<surge::DiscordNotifier>(config.webhook_url);
    notifier->start();
    notifier->notify_started(capture.interface_name(), config.threshold_mbps,
                             config.interval_seconds);
  }

  surge::Aggregator aggregator(config.interval(), frames);
  surge::Monitor monitor(config, interface_label, aggregator.results(),
                         config.metrics_enabled ? &registry : nullptr,
                         notifier.get());

  std::thread capture_thread([&capture]() {
    capture.run();
  });

  aggregator.start();

  std::thread monitor_thread([&monitor]() {
    monitor.run();
  });

  std::cout << "[Surge] Running. Press Ctrl+C to stop." << std::endl;

  int tick = 0;
  while (!g_shutdown.load(std::memory_order_acquire) && aggregator.is_running()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    if (++tick % 50 == 0) {
      std::cout << "[Surge] Status: "
                << capture.packets_captured() << " pkts captured, "
                << capture.packets_dropped() << " dropped, "
                << static_cast<int>(frames.fill_ratio() * 100) << "% queue, "
                << aggregator.frames_accepted() << " counted, "
                << aggregator.windows_emitted() << " windows"
                << std::endl;
    }
  }

  if (g_shutdown.load(std::memory_order_acquire)) {
    std::cout << "\n[Surge] Shutdown signal received, stopping capture..." << std::endl;
  }

  capture.stop();
  aggregator.stop();
  aggregator.wait();

  if (monitor_thread.joinable()) {
    monitor_thread.join();
  }
  if (capture_thread.joinable()) {
    capture_thread.join();
  }

  if (notifier) {
    notifier->stop();
  }
  if (metrics_server) {
    metrics_server->stop();
  }

  std::cout << "[Surge] Final stats: "
            << capture.packets_captured() << " packets captured, "
            << aggregator.frames_accepted() << " counted, "
            << monitor.windows_processed() << " windows, "
            << monitor.alerts_raised() << " alerts"
            << std::endl;
  std::cout << "[Surge] Network monitor stopped." << std::endl;

  return 0;
}
