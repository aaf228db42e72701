#pragma once

#include "traffic.hpp"
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace surge {

// Byte counters for the open window, keyed by source address. add() and
// swap_and_reset() share one mutex, so every byte lands in exactly one
// snapshot.
class WindowAccumulator {
public:
  WindowAccumulator() {
    index_.reserve(1024);
  }

  WindowAccumulator(const WindowAccumulator&) = delete;
  WindowAccumulator& operator=(const WindowAccumulator&) = delete;

  void add(const std::string& address, uint64_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = index_.find(address);
    if (it != index_.end()) {
      entries_[it->second].bytes += bytes;
      return;
    }

    index_.emplace(address, entries_.size());
    entries_.push_back(AddressBytes{address, bytes});
  }

  WindowSnapshot swap_and_reset() {
    WindowSnapshot snapshot;
    std::unordered_map<std::string, size_t> fresh_index;
    fresh_index.reserve(1024);

    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.swap(entries_);
    index_.swap(fresh_index);
    return snapshot;
  }

private:
  std::mutex                               mutex_;
  std::unordered_map<std::string, size_t>  index_;
  WindowSnapshot                           entries_;
};

}
