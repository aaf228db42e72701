#pragma once

#include "traffic.hpp"
#include <chrono>
#include <cstddef>
#include <vector>

namespace surge {

// Megabits per second for `bytes` over `window`; 0 for a non-positive window.
double rate_mbps(uint64_t bytes, std::chrono::duration<double> window);

uint64_t total_bytes(const WindowSnapshot& snapshot);

// The n largest contributors, descending by bytes. Equal counts keep their
// snapshot (first-seen) order.
std::vector<AddressBytes> top_n(const WindowSnapshot& snapshot, size_t n);

// top_n() with each entry converted to a rate over `window`.
std::vector<Talker> top_talkers(const WindowSnapshot& snapshot, size_t n,
                                std::chrono::duration<double> window);

}
