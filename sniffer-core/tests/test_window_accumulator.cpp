// tests/test_window_accumulator.cpp
#include <iostream>
#include <atomic>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "window_accumulator.hpp"
#include "throughput.hpp"

using namespace surge;

static int test_add_and_swap() {
  WindowAccumulator acc;
  acc.add("10.0.0.1", 300);
  acc.add("10.0.0.2", 100);
  acc.add("10.0.0.1", 200);

  auto snap = acc.swap_and_reset();
  if (snap.size() != 2) {
    std::cerr << "accumulator: expected 2 addresses got " << snap.size() << "\n";
    return 1;
  }
  if (snap[0].address != "10.0.0.1" || snap[0].bytes != 500) return 2;
  if (snap[1].address != "10.0.0.2" || snap[1].bytes != 100) return 3;

  auto empty = acc.swap_and_reset();
  if (!empty.empty()) {
    std::cerr << "accumulator: swap must leave an empty window behind\n";
    return 4;
  }

  // Entries are created again lazily after a reset.
  acc.add("10.0.0.2", 7);
  auto next = acc.swap_and_reset();
  if (next.size() != 1 || next[0].address != "10.0.0.2" || next[0].bytes != 7) return 5;
  return 0;
}

// Writers keep adding while another thread swaps; every byte must appear in
// exactly one snapshot.
static int test_concurrent_conservation() {
  WindowAccumulator acc;
  constexpr int WRITERS = 4;
  constexpr int PER_WRITER = 20000;

  std::atomic<bool> writers_done{false};
  std::vector<WindowSnapshot> snapshots;

  std::thread swapper([&] {
    while (!writers_done.load()) {
      snapshots.push_back(acc.swap_and_reset());
      std::this_thread::yield();
    }
  });

  std::vector<std::thread> writers;
  for (int w = 0; w < WRITERS; w++) {
    writers.emplace_back([&acc, w] {
      const std::string own = "10.0.1." + std::to_string(w);
      for (int i = 0; i < PER_WRITER; i++) {
        acc.add(own, static_cast<uint64_t>(i % 1500 + 1));
        acc.add("10.0.0.99", 1);
      }
    });
  }
  for (auto& t : writers) t.join();
  writers_done.store(true);
  swapper.join();
  snapshots.push_back(acc.swap_and_reset());

  uint64_t expected = 0;
  for (int i = 0; i < PER_WRITER; i++) {
    expected += static_cast<uint64_t>(i % 1500 + 1) + 1;
  }
  expected *= WRITERS;

  uint64_t seen = 0;
  for (const auto& snap : snapshots) {
    std::set<std::string> addresses;
    for (const auto& entry : snap) {
      if (!addresses.insert(entry.address).second) {
        std::cerr << "accumulator: address repeated within one snapshot\n";
        return 10;
      }
    }
    seen += total_bytes(snap);
  }

  if (seen != expected) {
    std::cerr << "accumulator: expected " << expected << " bytes across snapshots, got "
              << seen << "\n";
    return 11;
  }
  return 0;
}

int main() {
  int rc = 0;
  if ((rc = test_add_and_swap()) != 0) return rc;
  if ((rc = test_concurrent_conservation()) != 0) return rc;

  std::cout << "test_window_accumulator: OK\n";
  return 0;
}
