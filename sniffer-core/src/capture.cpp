#include "capture.hpp"

#include <pcap.h>
#include <algorithm>
#include <cctype>
#include <iostream>

namespace surge {

namespace {

bool mentions_permission(std::string message) {
  std::transform(message.begin(), message.end(), message.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return message.find("permission denied") != std::string::npos ||
         message.find("operation not permitted") != std::string::npos;
}

}

CaptureEngine::CaptureEngine(const MonitorConfig& config, FrameChannel& frames)
  : pcap_file_(config.pcap_file), frames_(frames) {

  if (!pcap_file_.empty()) {
    interface_ = pcap_file_;
  } else if (config.interface_name.empty()) {
    interface_ = auto_detect_interface();
  } else {
    interface_ = config.interface_name;
  }
}

CaptureEngine::~CaptureEngine() {
  stop();
  if (handle_) {
    pcap_close(handle_);
    handle_ = nullptr;
  }
}

std::vector<NetworkInterface> CaptureEngine::list_interfaces() {
  std::vector<NetworkInterface> result;
  pcap_if_t* alldevs = nullptr;
  char errbuf[PCAP_ERRBUF_SIZE];

  if (pcap_findalldevs(&alldevs, errbuf) == -1) {
    std::cerr << "[Surge] pcap_findalldevs failed: " << errbuf << std::endl;
    return result;
  }

  for (pcap_if_t* d = alldevs; d != nullptr; d = d->next) {
    NetworkInterface iface;
    iface.name = d->name;
    iface.description = d->description ? d->description : "";
    iface.is_loopback = (d->flags & PCAP_IF_LOOPBACK) != 0;
    iface.is_up = (d->flags & PCAP_IF_UP) != 0;
    iface.has_addresses = d->addresses != nullptr;

    result.push_back(std::move(iface));
  }

  pcap_freealldevs(alldevs);
  return result;
}

std::string CaptureEngine::auto_detect_interface() {
  auto interfaces = list_interfaces();

  for (const auto& iface : interfaces) {
    if (iface.is_loopback || iface.name.rfind("lo", 0) == 0) continue;
    if (!iface.has_addresses) continue;

    std::cout << "[Surge] No interface specified, using first valid device found: "
              << iface.name;
    if (!iface.description.empty()) {
      std::cout << " (" << iface.description << ")";
    }
    std::cout << std::endl;
    return iface.name;
  }

  std::cerr << "[Surge] Error: no suitable network interface found "
            << "(non-loopback with addresses)" << std::endl;
  return "";
}

bool CaptureEngine::open() {
  char errbuf[PCAP_ERRBUF_SIZE];

  if (is_offline()) {
    handle_ = pcap_open_offline(pcap_file_.c_str(), errbuf);
    if (!handle_) {
      std::cerr << "[Surge] pcap_open_offline failed for " << pcap_file_
                << ": " << errbuf << std::endl;
      return false;
    }
  } else {
    if (interface_.empty()) {
      std::cerr << "[Surge] Cannot start capture: no interface configured" << std::endl;
      return false;
    }

    handle_ = pcap_open_live(
      interface_.c_str(),
      SNAPSHOT_LEN,
      1,
      READ_TIMEOUT_MS,
      errbuf
    );

    if (!handle_) {
      std::cerr << "[Surge] Error opening device " << interface_ << ": " << errbuf << std::endl;
      if (mentions_permission(errbuf)) {
        std::cerr << "[Surge] Permission denied. Run with sudo or set capabilities "
                  << "(e.g., sudo setcap cap_net_raw,cap_net_admin=eip <binary>)" << std::endl;
      }
      return false;
    }
  }

  struct bpf_program program;
  if (pcap_compile(handle_, &program, BPF_FILTER, 1, PCAP_NETMASK_UNKNOWN) == -1) {
    std::cerr << "[Surge] Error compiling BPF filter '" << BPF_FILTER << "': "
              << pcap_geterr(handle_) << std::endl;
    pcap_close(handle_);
    handle_ = nullptr;
    return false;
  }

  int rc = pcap_setfilter(handle_, &program);
  pcap_freecode(&program);
  if (rc == -1) {
    std::cerr << "[Surge] Error setting BPF filter '" << BPF_FILTER << "': "
              << pcap_geterr(handle_) << std::endl;
    pcap_close(handle_);
    handle_ = nullptr;
    return false;
  }

  link_type_ = pcap_datalink(handle_);
  if (link_type_ != DLT_EN10MB && link_type_ != DLT_LINUX_SLL &&
      link_type_ != DLT_NULL && link_type_ != DLT_RAW) {
    std::cerr << "[Surge] Warning: unusual link type " << link_type_
              << ", parsing may be incomplete" << std::endl;
  }

  std::cout << "[Surge] Using BPF filter: " << BPF_FILTER << std::endl;
  std::cout << "[Surge] Successfully opened " << (is_offline() ? "capture file " : "interface ")
            << interface_ << " for capture." << std::endl;
  return true;
}

void CaptureEngine::run() {
  if (!handle_) {
    std::cerr << "[Surge] Capture not opened" << std::endl;
    frames_.close();
    return;
  }

  running_.store(true, std::memory_order_release);
  std::cout << "[Surge] Capture started on " << interface_ << std::endl;

  struct pcap_pkthdr* header;
  const uint8_t* data;

  while (!stop_requested_.load(std::memory_order_acquire)) {
    int result = pcap_next_ex(handle_, &header, &data);

    if (result == 1) {
      RawFrame frame;
      frame.timestamp = RawFrame::clock::from_time_t(header->ts.tv_sec) +
                        std::chrono::microseconds(header->ts.tv_usec);
      frame.wire_len = header->len;
      frame.link_type = link_type_;
      frame.data.assign(data, data + header->caplen);
      packets_captured_.fetch_add(1, std::memory_order_relaxed);

      if (is_offline()) {
        // Replay applies back-pressure instead of dropping.
        if (!frames_.push(std::move(frame))) break;
      } else if (frames_.try_push(std::move(frame)) != ChannelStatus::Ok) {
        queue_drops_.fetch_add(1, std::memory_order_relaxed);
      }

    } else if (result == 0) {
      continue;

    } else if (result == -1) {
      std::cerr << "[Surge] pcap_next_ex error: " << pcap_geterr(handle_) << std::endl;
      if (is_offline()) break;
      continue;

    } else {
      // -2: end of file or pcap_breakloop()
      break;
    }
  }

  frames_.close();
  running_.store(false, std::memory_order_release);
  std::cout << "[Surge] Capture stopped (" << packets_captured() << " packets)" << std::endl;
}

void CaptureEngine::stop() {
  stop_requested_.store(true, std::memory_order_release);
  if (handle_) {
    pcap_breakloop(handle_);
  }
  // Unblocks a replay that is waiting for room in the channel.
  frames_.close();
}

uint64_t CaptureEngine::packets_dropped() const {
  uint64_t drops = queue_drops_.load(std::memory_order_relaxed);
  if (!handle_ || is_offline()) return drops;
  struct pcap_stat stats;
  if (pcap_stats(handle_, &stats) == 0) {
    drops += stats.ps_drop;
  }
  return drops;
}

}
