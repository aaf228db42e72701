#include "frame_decoder.hpp"

#include <pcap.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <algorithm>
#include <cstring>

namespace surge {

namespace {

struct IPv4Header {
  uint8_t  ver_ihl;
  uint8_t  tos;
  uint16_t total_len;
  uint16_t id;
  uint16_t frag_off;
  uint8_t  ttl;
  uint8_t  protocol;
  uint16_t checksum;
  uint8_t  src_addr[4];
  uint8_t  dst_addr[4];

  uint8_t ihl() const { return (ver_ihl & 0x0F) * 4; }
  uint8_t version() const { return (ver_ihl >> 4); }
};

constexpr size_t IPV4_MIN_HEADER = 20;
constexpr size_t IPV6_HEADER     = 40;

constexpr uint16_t ETH_TYPE_IP   = 0x0800;
constexpr uint16_t ETH_TYPE_IPV6 = 0x86DD;
constexpr uint16_t ETH_TYPE_VLAN = 0x8100; // 802.1Q VLAN tag
constexpr uint16_t ETH_TYPE_QINQ = 0x88A8; // 802.1ad QinQ

uint16_t read_be16(const uint8_t* p) {
  return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}

std::optional<PacketInfo> decode_ipv4(const uint8_t* data, size_t caplen, size_t offset) {
  if (caplen < offset + IPV4_MIN_HEADER) return std::nullopt;

  IPv4Header ip;
  std::memcpy(&ip, data + offset, sizeof(ip));
  if (ip.version() != 4) return std::nullopt;

  const size_t ihl_bytes = ip.ihl();
  const size_t available = caplen - offset;
  if (ihl_bytes < IPV4_MIN_HEADER || available < ihl_bytes) return std::nullopt;

  size_t ip_len = read_be16(reinterpret_cast<const uint8_t*>(&ip.total_len));
  // Segmentation offload hands us packets with the length left at zero.
  if (ip_len == 0) ip_len = available;
  if (ip_len < ihl_bytes) return std::nullopt;

  char text[INET_ADDRSTRLEN];
  if (!inet_ntop(AF_INET, ip.src_addr, text, sizeof(text))) return std::nullopt;

  PacketInfo info;
  info.ip_version = 4;
  info.src_addr = text;
  // Header plus whatever payload was actually captured.
  info.length = static_cast<uint32_t>(std::min(ip_len, available));
  return info;
}

std::optional<PacketInfo> decode_ipv6(const uint8_t* data, size_t caplen, size_t offset,
                                      uint32_t wire_len) {
  if (caplen < offset + IPV6_HEADER) return std::nullopt;
  if ((data[offset] >> 4) != 6) return std::nullopt;

  char text[INET6_ADDRSTRLEN];
  if (!inet_ntop(AF_INET6, data + offset + 8, text, sizeof(text))) return std::nullopt;

  PacketInfo info;
  info.ip_version = 6;
  info.src_addr = text;
  // The payload-length field excludes the fixed header and is zero for
  // jumbograms, so the capture's frame length is used instead.
  info.length = wire_len != 0 ? wire_len : static_cast<uint32_t>(caplen);
  return info;
}

std::optional<PacketInfo> decode_by_version(const uint8_t* data, size_t caplen, size_t offset,
                                            uint32_t wire_len) {
  if (caplen <= offset) return std::nullopt;
  switch (data[offset] >> 4) {
    case 4:  return decode_ipv4(data, caplen, offset);
    case 6:  return decode_ipv6(data, caplen, offset, wire_len);
    default: return std::nullopt;
  }
}

}

std::optional<PacketInfo> decode_frame(const RawFrame& frame) {
  const uint8_t* data = frame.data.data();
  const size_t caplen = frame.data.size();
  const int link_type = frame.link_type;

  size_t eth_offset = 0;
  uint16_t eth_type = 0;

  if (link_type == DLT_EN10MB) {
    if (caplen < 14) return std::nullopt;
    eth_type = read_be16(data + 12);
    eth_offset = 14;
  }
#ifdef DLT_LINUX_SLL
  else if (link_type == DLT_LINUX_SLL) {
    if (caplen < 16) return std::nullopt;
    eth_type = read_be16(data + 14);
    eth_offset = 16;
  }
#endif
  else if (link_type == DLT_NULL) {
    if (caplen < 4) return std::nullopt;
    // Address family in host byte order; the version nibble settles it.
    return decode_by_version(data, caplen, 4, frame.wire_len);
  }
  else if (link_type == DLT_RAW) {
    return decode_by_version(data, caplen, 0, frame.wire_len);
  }
#ifdef DLT_IPV4
  else if (link_type == DLT_IPV4) {
    return decode_ipv4(data, caplen, 0);
  }
#endif
#ifdef DLT_IPV6
  else if (link_type == DLT_IPV6) {
    return decode_ipv6(data, caplen, 0, frame.wire_len);
  }
#endif
  else {
    return std::nullopt;
  }

  // Strip 802.1Q/QinQ VLAN tags (4 bytes each)
  for (int vlan_layers = 0; vlan_layers < 2; vlan_layers++) {
    if (eth_type == ETH_TYPE_VLAN || eth_type == ETH_TYPE_QINQ) {
      if (caplen < eth_offset + 4) return std::nullopt;
      // Inner ethertype is at offset +2 within the VLAN tag
      eth_type = read_be16(data + eth_offset + 2);
      eth_offset += 4;
    } else {
      break;
    }
  }

  if (eth_type == ETH_TYPE_IP) {
    return decode_ipv4(data, caplen, eth_offset);
  }
  if (eth_type == ETH_TYPE_IPV6) {
    return decode_ipv6(data, caplen, eth_offset, frame.wire_len);
  }
  return std::nullopt;
}

}
