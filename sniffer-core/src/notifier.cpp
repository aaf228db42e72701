#include "notifier.hpp"
#include "alert_schema.hpp"

#include <ixwebsocket/IXHttpClient.h>
#include <iostream>

namespace surge {

DiscordNotifier::DiscordNotifier(std::string webhook_url)
  : webhook_url_(std::move(webhook_url)) {}

DiscordNotifier::~DiscordNotifier() {
  stop();
}

void DiscordNotifier::start() {
  if (worker_.joinable()) return;
  worker_ = std::thread([this]() { run(); });
}

void DiscordNotifier::stop() {
  queue_.close();
  if (worker_.joinable()) {
    worker_.join();
  }
}

void DiscordNotifier::notify_started(const std::string& interface_name,
                                     double threshold_mbps, int interval_seconds) {
  if (webhook_url_.empty()) {
    std::cout << "[Surge] Webhook URL is empty, skipping initialization notification." << std::endl;
    return;
  }

  auto payload = startup_to_json(interface_name, threshold_mbps, interval_seconds,
                                 rfc3339_utc(std::chrono::system_clock::now()));
  enqueue(Delivery{"init", payload.dump()});
}

void DiscordNotifier::notify_threshold(const ThresholdAlert& alert) {
  if (webhook_url_.empty()) return;

  auto payload = threshold_alert_to_json(alert, rfc3339_utc(std::chrono::system_clock::now()));
  enqueue(Delivery{"threshold", payload.dump()});
}

void DiscordNotifier::enqueue(Delivery delivery) {
  ChannelStatus status = queue_.try_push(std::move(delivery));
  if (status == ChannelStatus::Full) {
    failed_.fetch_add(1, std::memory_order_relaxed);
    std::cerr << "[Surge] Notification queue full, dropping notification" << std::endl;
  } else if (status == ChannelStatus::Closed) {
    failed_.fetch_add(1, std::memory_order_relaxed);
    std::cerr << "[Surge] Notifier stopped, dropping notification" << std::endl;
  }
}

void DiscordNotifier::run() {
  Delivery delivery;
  while (queue_.pop(delivery)) {
    if (post(delivery)) {
      delivered_.fetch_add(1, std::memory_order_relaxed);
    } else {
      failed_.fetch_add(1, std::memory_order_relaxed);
    }
  }
}

bool DiscordNotifier::post(const Delivery& delivery) {
  ix::HttpClient client;
  ix::HttpRequestArgsPtr args = client.createRequest();
  args->extraHeaders["Content-Type"] = "application/json";
  args->connectTimeout = 10;
  args->transferTimeout = 10;

  ix::HttpResponsePtr response = client.post(webhook_url_, delivery.payload, args);

  if (response->errorCode != ix::HttpErrorCode::Ok) {
    std::cerr << "[Surge] Error sending " << delivery.label
              << " notification: " << response->errorMsg << std::endl;
    return false;
  }

  if (response->statusCode < 200 || response->statusCode >= 300) {
    std::cerr << "[Surge] Received non-2xx status code from Discord on " << delivery.label
              << ": " << response->statusCode << " - " << response->body << std::endl;
    return false;
  }

  std::cout << "[Surge] Successfully sent " << delivery.label
            << " notification to Discord." << std::endl;
  return true;
}

}
