#ifdef RANSOMWATCH_HAVE_URING

#include "app/MetricsServer.hpp"
#include "util/Log.hpp"
#include <liburing.h>
#include <netinet/in.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <string_view>

namespace ransomwatch::app {

namespace {

constexpr uint64_t kAcceptDone = 1;
constexpr uint64_t kStopDone = 2;

int open_listener(uint16_t port) {
  int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) return -1;
  int one = 1;
  (void)::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 || ::listen(fd, 4) < 0) {
    int saved = errno;
    ::close(fd);
    errno = saved;
    return -1;
  }
  return fd;
}

std::string reply(const char* status, const std::string& body) {
  std::string out = std::string("HTTP/1.1 ") + status +
                    "\r\nContent-Type: text/plain; version=0.0.4; charset=utf-8\r\nConnection: close\r\nContent-Length: " +
                    std::to_string(body.size()) + "\r\n\r\n";
  out += body;
  return out;
}

} // namespace

MetricsServer::MetricsServer(const ResultBuffers& buffers, uint16_t port)
    : buffers_(buffers), port_(port) {}

MetricsServer::~MetricsServer() { stop(); }

void MetricsServer::start() {
  listen_fd_ = open_listener(port_);
  if (listen_fd_ < 0) {
    RW_LOG_ERROR("MetricsServer", "cannot listen on :%u: %s", static_cast<unsigned>(port_), std::strerror(errno));
    return;
  }
  stop_fd_ = ::eventfd(0, EFD_CLOEXEC);
  if (stop_fd_ < 0) {
    RW_LOG_ERROR("MetricsServer", "eventfd() failed: %s", std::strerror(errno));
    ::close(listen_fd_);
    listen_fd_ = -1;
    return;
  }
  thread_ = std::jthread([this] { run(); });
}

void MetricsServer::stop() {
  if (thread_.joinable()) {
    uint64_t one = 1;
    if (::write(stop_fd_, &one, sizeof(one)) < 0)
      RW_LOG_WARN("MetricsServer", "cannot wake server thread: %s", std::strerror(errno));
    thread_.join();
  }
  if (stop_fd_ >= 0) { ::close(stop_fd_); stop_fd_ = -1; }
  if (listen_fd_ >= 0) { ::close(listen_fd_); listen_fd_ = -1; }
}

void MetricsServer::run() {
  io_uring ring{};
  if (int rc = io_uring_queue_init(4, &ring, 0); rc < 0) {
    RW_LOG_ERROR("MetricsServer", "io_uring_queue_init() failed: %s", std::strerror(-rc));
    return;
  }
  uint64_t wake = 0;
  auto arm_accept = [&] {
    io_uring_sqe* sqe = io_uring_get_sqe(&ring);
    io_uring_prep_accept(sqe, listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
    io_uring_sqe_set_data64(sqe, kAcceptDone);
  };
  arm_accept();
  io_uring_sqe* sqe = io_uring_get_sqe(&ring);
  io_uring_prep_read(sqe, stop_fd_, &wake, sizeof(wake), 0);
  io_uring_sqe_set_data64(sqe, kStopDone);
  io_uring_submit(&ring);
  RW_LOG_INFO("MetricsServer", "serving /metrics on :%u", static_cast<unsigned>(port_));

  for (;;) {
    io_uring_cqe* cqe = nullptr;
    if (int rc = io_uring_wait_cqe(&ring, &cqe); rc < 0) {
      if (rc == -EINTR) continue;
      RW_LOG_ERROR("MetricsServer", "io_uring_wait_cqe() failed: %s", std::strerror(-rc));
      break;
    }
    const uint64_t what = io_uring_cqe_get_data64(cqe);
    const int res = cqe->res;
    io_uring_cqe_seen(&ring, cqe);
    if (what == kStopDone) break;
    if (res >= 0) {
      serve(res);
      ::close(res);
    } else {
      RW_LOG_DEBUG("MetricsServer", "accept failed: %s", std::strerror(-res));
    }
    arm_accept();
    io_uring_submit(&ring);
  }
  io_uring_queue_exit(&ring);
}

// One request per connection; only GET /metrics is served.
void MetricsServer::serve(int fd) {
  timeval tv{.tv_sec = 5, .tv_usec = 0};
  (void)::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  char buf[1024];
  ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
  if (n <= 0) return;
  std::string_view req(buf, static_cast<size_t>(n));

  std::string out;
  if (!req.starts_with("GET /metrics")) {
    out = reply("404 Not Found", "not found\n");
  } else if (auto latest = buffers_.front()) {
    out = reply("200 OK", detection_to_prometheus(*latest));
  } else {
    out = reply("503 Service Unavailable", "no detection result yet\n");
  }
  if (::send(fd, out.data(), out.size(), MSG_NOSIGNAL) < 0)
    RW_LOG_DEBUG("MetricsServer", "send failed: %s", std::strerror(errno));
}

} // namespace ransomwatch::app

#endif // RANSOMWATCH_HAVE_URING
