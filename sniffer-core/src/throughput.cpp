#include "throughput.hpp"
#include <algorithm>

namespace surge {

double rate_mbps(uint64_t bytes, std::chrono::duration<double> window) {
  const double seconds = window.count();
  if (seconds <= 0) return 0.0;
  return (static_cast<double>(bytes) * 8.0) / (seconds * 1000000.0);
}

uint64_t total_bytes(const WindowSnapshot& snapshot) {
  uint64_t total = 0;
  for (const auto& entry : snapshot) {
    total += entry.bytes;
  }
  return total;
}

std::vector<AddressBytes> top_n(const WindowSnapshot& snapshot, size_t n) {
  std::vector<AddressBytes> ranked(snapshot.begin(), snapshot.end());

  std::stable_sort(
    ranked.begin(),
    ranked.end(),
    [](const AddressBytes& a, const AddressBytes& b) { return a.bytes > b.bytes; }
  );

  if (ranked.size() > n) {
    ranked.resize(n);
  }
  return ranked;
}

std::vector<Talker> top_talkers(const WindowSnapshot& snapshot, size_t n,
                                std::chrono::duration<double> window) {
  auto ranked = top_n(snapshot, n);

  std::vector<Talker> result;
  result.reserve(ranked.size());
  for (auto& entry : ranked) {
    Talker talker;
    talker.rate_mbps = rate_mbps(entry.bytes, window);
    talker.bytes = entry.bytes;
    talker.address = std::move(entry.address);
    result.push_back(std::move(talker));
  }
  return result;
}

}
