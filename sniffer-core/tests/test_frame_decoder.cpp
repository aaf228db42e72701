// tests/test_frame_decoder.cpp
#include <iostream>

#include "frame_decoder.hpp"
#include "frame_builder.hpp"

using namespace surge;
using namespace surge::test;

static int test_ipv4_ethernet() {
  auto info = decode_frame(ipv4_frame("10.0.0.1", 300));
  if (!info) {
    std::cerr << "decoder: IPv4 frame not decoded\n";
    return 1;
  }
  if (info->ip_version != 4 || info->src_addr != "10.0.0.1") return 2;
  if (info->length != 300) {
    std::cerr << "decoder: IPv4 length expected 300 got " << info->length << "\n";
    return 3;
  }
  return 0;
}

static int test_ipv4_truncated_capture() {
  // 1500-byte packet, 96 bytes of it captured: only what is present counts.
  auto info = decode_frame(ipv4_frame("172.16.5.4", 1500, 96));
  if (!info || info->length != 96) {
    std::cerr << "decoder: truncated IPv4 should count captured bytes\n";
    return 10;
  }
  return 0;
}

static int test_ipv4_zero_total_length() {
  auto frame = ipv4_frame("192.168.1.20", 400);
  // Segmentation offload leaves the total-length field unset.
  frame.data[ETH_HEADER + 2] = 0;
  frame.data[ETH_HEADER + 3] = 0;
  auto info = decode_frame(frame);
  if (!info || info->length != 400) {
    std::cerr << "decoder: zero total length should fall back to captured bytes\n";
    return 20;
  }
  return 0;
}

static int test_ipv4_length_below_header_is_malformed() {
  auto frame = ipv4_frame("192.168.1.21", 60);
  frame.data[ETH_HEADER + 2] = 0;
  frame.data[ETH_HEADER + 3] = 12;
  if (decode_frame(frame)) {
    std::cerr << "decoder: total length below the header size must be rejected\n";
    return 30;
  }
  return 0;
}

static int test_ipv6_uses_capture_length() {
  auto info = decode_frame(ipv6_frame("2001:db8::1", 0, 1200));
  if (!info) {
    std::cerr << "decoder: IPv6 frame not decoded\n";
    return 40;
  }
  if (info->ip_version != 6 || info->src_addr != "2001:db8::1") return 41;
  if (info->length != 1200) {
    std::cerr << "decoder: IPv6 length expected 1200 got " << info->length << "\n";
    return 42;
  }
  return 0;
}

static int test_non_ip_skipped() {
  if (decode_frame(arp_frame())) {
    std::cerr << "decoder: ARP must not decode\n";
    return 50;
  }

  RawFrame runt;
  runt.link_type = DLT_EN10MB;
  runt.data.assign(10, 0);
  if (decode_frame(runt)) return 51;

  auto truncated = ipv4_frame("10.0.0.5", 100, 12);
  if (decode_frame(truncated)) {
    std::cerr << "decoder: IPv4 header cut short must not decode\n";
    return 52;
  }

  auto unknown_link = ipv4_frame("10.0.0.6", 100);
  unknown_link.link_type = 9999;
  if (decode_frame(unknown_link)) return 53;
  return 0;
}

static int test_vlan_tagged() {
  auto frame = ipv4_frame("10.9.8.7", 128);
  // Insert an 802.1Q tag in front of the IPv4 ethertype.
  std::vector<uint8_t> tag = {0x81, 0x00, 0x00, 0x64};
  frame.data.insert(frame.data.begin() + 12, tag.begin(), tag.end());

  auto info = decode_frame(frame);
  if (!info || info->src_addr != "10.9.8.7" || info->length != 128) {
    std::cerr << "decoder: VLAN-tagged IPv4 not decoded\n";
    return 60;
  }
  return 0;
}

static int test_raw_ip_link() {
  auto frame = ipv4_frame("198.51.100.3", 256);
  frame.data.erase(frame.data.begin(), frame.data.begin() + ETH_HEADER);
  frame.link_type = DLT_RAW;

  auto info = decode_frame(frame);
  if (!info || info->src_addr != "198.51.100.3" || info->length != 256) {
    std::cerr << "decoder: raw IPv4 not decoded\n";
    return 70;
  }
  return 0;
}

int main() {
  int rc = 0;
  if ((rc = test_ipv4_ethernet()) != 0) return rc;
  if ((rc = test_ipv4_truncated_capture()) != 0) return rc;
  if ((rc = test_ipv4_zero_total_length()) != 0) return rc;
  if ((rc = test_ipv4_length_below_header_is_malformed()) != 0) return rc;
  if ((rc = test_ipv6_uses_capture_length()) != 0) return rc;
  if ((rc = test_non_ip_skipped()) != 0) return rc;
  if ((rc = test_vlan_tagged()) != 0) return rc;
  if ((rc = test_raw_ip_link()) != 0) return rc;

  std::cout << "test_frame_decoder: OK\n";
  return 0;
}
