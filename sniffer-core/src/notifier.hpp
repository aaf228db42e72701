#pragma once

#include "traffic.hpp"
#include "channel.hpp"
#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace surge {

struct ThresholdAlert {
  std::string         interface_name;
  double              threshold_mbps   = 0.0;
  double              overall_mbps     = 0.0;
  int                 interval_seconds = 0;
  std::vector<Talker> top_talkers;
};

class Notifier {
public:
  virtual ~Notifier() = default;

  virtual void notify_started(const std::string& interface_name,
                              double threshold_mbps, int interval_seconds) = 0;
  virtual void notify_threshold(const ThresholdAlert& alert) = 0;
};

// Posts Discord webhook embeds from a background worker so a slow or
// unreachable webhook never stalls the caller.
class DiscordNotifier : public Notifier {
public:
  explicit DiscordNotifier(std::string webhook_url);
  ~DiscordNotifier() override;

  DiscordNotifier(const DiscordNotifier&) = delete;
  DiscordNotifier& operator=(const DiscordNotifier&) = delete;

  void start();
  // Delivers what is already queued, then joins the worker.
  void stop();

  void notify_started(const std::string& interface_name,
                      double threshold_mbps, int interval_seconds) override;
  void notify_threshold(const ThresholdAlert& alert) override;

  uint64_t delivered() const { return delivered_.load(std::memory_order_relaxed); }
  uint64_t failed() const { return failed_.load(std::memory_order_relaxed); }

private:
  struct Delivery {
    std::string label;
    std::string payload;
  };

  void enqueue(Delivery delivery);
  void run();
  bool post(const Delivery& delivery);

  std::string           webhook_url_;
  Channel<Delivery>     queue_{32};
  std::thread           worker_;
  std::atomic<uint64_t> delivered_{0};
  std::atomic<uint64_t> failed_{0};
};

}
