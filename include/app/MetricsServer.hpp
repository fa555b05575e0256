#pragma once

#include <cstdint>
#include <string>
#include <thread>
#include "app/ResultBuffers.hpp"
#include "model/Detection.hpp"

namespace ransomwatch::app {

// Serialize one DetectionResult into Prometheus text exposition format (version 0.0.4).
// Also used for the on-disk detection history.
[[nodiscard]] std::string detection_to_prometheus(const ransomwatch::model::DetectionResult& r);

// Scrape endpoint for the most recent detection result. Built on io_uring
// when liburing is available; otherwise start() only logs that the
// endpoint is unavailable.
class MetricsServer {
public:
  MetricsServer(const ResultBuffers& buffers, uint16_t port);
  ~MetricsServer();
  MetricsServer(const MetricsServer&) = delete;
  MetricsServer& operator=(const MetricsServer&) = delete;

  void start();
  void stop();

private:
  void run();
  void serve(int client_fd);

  const ResultBuffers& buffers_;
  uint16_t port_;
  int listen_fd_{-1};
  int stop_fd_{-1};       // eventfd that wakes the server thread on stop()
  std::jthread thread_;
};

} // namespace ransomwatch::app
