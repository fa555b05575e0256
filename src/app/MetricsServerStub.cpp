#ifndef RANSOMWATCH_HAVE_URING

#include "app/MetricsServer.hpp"
#include "util/Log.hpp"

namespace ransomwatch::app {

MetricsServer::MetricsServer(const ResultBuffers& buffers, uint16_t port)
    : buffers_(buffers), port_(port) {}

MetricsServer::~MetricsServer() = default;

void MetricsServer::start() {
  RW_LOG_WARN("MetricsServer", "metrics endpoint unavailable on :%u (built without liburing)",
              static_cast<unsigned>(port_));
}

void MetricsServer::stop() {}

} // namespace ransomwatch::app

#endif // RANSOMWATCH_HAVE_URING
