#pragma once

#include "metrics_registry.hpp"
#include <ixwebsocket/IXHttpServer.h>
#include <atomic>
#include <iostream>
#include <memory>
#include <string>

namespace surge {

// Serves MetricsRegistry::render() on GET /metrics.
class MetricsServer {
public:
  MetricsServer(uint16_t port, const MetricsRegistry& registry)
    : port_(port), registry_(registry), server_(static_cast<int>(port), "0.0.0.0") {}

  ~MetricsServer() { stop(); }

  MetricsServer(const MetricsServer&) = delete;
  MetricsServer& operator=(const MetricsServer&) = delete;

  bool start() {
    server_.setOnConnectionCallback(
      [this](ix::HttpRequestPtr request,
             std::shared_ptr<ix::ConnectionState> state) -> ix::HttpResponsePtr {
        (void)state;
        return handle_request(request);
      }
    );

    auto res = server_.listen();
    if (!res.first) {
      std::cerr << "[Surge] Metrics server failed to listen on port "
                << port_ << ": " << res.second << std::endl;
      return false;
    }

    server_.start();
    running_.store(true, std::memory_order_release);
    std::cout << "[Surge] Prometheus metrics on http://0.0.0.0:"
              << port_ << "/metrics" << std::endl;
    return true;
  }

  void stop() {
    if (running_.exchange(false)) {
      server_.stop();
      std::cout << "[Surge] Metrics server stopped" << std::endl;
    }
  }

private:
  ix::HttpResponsePtr handle_request(const ix::HttpRequestPtr& request) {
    ix::WebSocketHttpHeaders headers;

    const std::string path = request->uri.substr(0, request->uri.find('?'));
    if (request->method != "GET" || path != "/metrics") {
      headers["Content-Type"] = "text/plain";
      return std::make_shared<ix::HttpResponse>(
        404, "Not Found", ix::HttpErrorCode::Ok, headers, "not found\n");
    }

    headers["Content-Type"] = "text/plain; version=0.0.4; charset=utf-8";
    return std::make_shared<ix::HttpResponse>(
      200, "OK", ix::HttpErrorCode::Ok, headers, registry_.render());
  }

  uint16_t               port_;
  const MetricsRegistry& registry_;
  ix::HttpServer         server_;
  std::atomic<bool>      running_{false};
};

}
