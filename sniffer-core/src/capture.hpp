#pragma once

#include "traffic.hpp"
#include "channel.hpp"
#include "config.hpp"
#include <atomic>
#include <string>
#include <vector>

struct pcap;
typedef struct pcap pcap_t;

namespace surge {

struct NetworkInterface {
  std::string name;
  std::string description;
  bool        is_loopback;
  bool        is_up;
  bool        has_addresses;
};

// Feeds raw frames from a live interface or a pcap file into a
// FrameChannel. Closing that channel is how the end of the source is
// signalled downstream.
class CaptureEngine {
public:
  using FrameChannel = Channel<RawFrame>;

  static constexpr int         SNAPSHOT_LEN    = 1024;
  static constexpr int         READ_TIMEOUT_MS = 1000;
  static constexpr const char* BPF_FILTER      = "ip or ip6";

  CaptureEngine(const MonitorConfig& config, FrameChannel& frames);
  ~CaptureEngine();

  CaptureEngine(const CaptureEngine&) = delete;
  CaptureEngine& operator=(const CaptureEngine&) = delete;

  static std::vector<NetworkInterface> list_interfaces();
  static std::string auto_detect_interface();

  bool open();
  // Capture loop; returns on stop(), end of file or a fatal read error.
  void run();
  void stop();

  bool is_offline() const { return !pcap_file_.empty(); }
  uint64_t packets_captured() const { return packets_captured_.load(); }
  uint64_t packets_dropped() const;
  const std::string& interface_name() const { return interface_; }

private:
  std::string           interface_;
  std::string           pcap_file_;
  FrameChannel&         frames_;
  pcap_t*               handle_ = nullptr;
  int                   link_type_ = 0;
  std::atomic<bool>     running_{false};
  std::atomic<bool>     stop_requested_{false};
  std::atomic<uint64_t> packets_captured_{0};
  std::atomic<uint64_t> queue_drops_{0};
};

}
