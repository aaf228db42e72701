#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <chrono>

namespace surge {

struct RawFrame {
  using clock = std::chrono::system_clock;
  using time_point = clock::time_point;

  time_point           timestamp;
  uint32_t             wire_len  = 0;
  int                  link_type = 0;
  std::vector<uint8_t> data;
};

struct PacketInfo {
  uint8_t     ip_version = 0;
  std::string src_addr;
  uint32_t    length     = 0;
};

struct AddressBytes {
  std::string address;
  uint64_t    bytes = 0;
};

// Per-source byte counts for one completed window, in first-seen order.
using WindowSnapshot = std::vector<AddressBytes>;

struct WindowResult {
  WindowSnapshot snapshot;
  uint64_t       total_bytes = 0;
  double         rate_mbps   = 0.0;
  std::chrono::duration<double> window{0.0};
  std::chrono::duration<double> elapsed{0.0};
  bool           final_flush = false;
};

struct Talker {
  std::string address;
  uint64_t    bytes     = 0;
  double      rate_mbps = 0.0;
};

}
