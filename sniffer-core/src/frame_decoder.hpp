#pragma once

#include "traffic.hpp"
#include <optional>

namespace surge {

// Extracts the IP source address and the byte length to attribute to it.
// Returns nullopt for anything that is not a decodable IPv4/IPv6 packet.
std::optional<PacketInfo> decode_frame(const RawFrame& frame);

}
