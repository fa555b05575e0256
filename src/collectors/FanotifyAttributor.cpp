#include "collectors/FanotifyAttributor.hpp"
#include "util/Log.hpp"

#include <sys/fanotify.h>
#include <fcntl.h>
#include <limits.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>

namespace ransomwatch::collectors {

FanotifyAttributor::~FanotifyAttributor() { stop(); }

bool FanotifyAttributor::start(const std::vector<std::string>& roots) {
  if (fd_ >= 0) return true;
  // notification class only: events are observed after the fact, never blocked
  fd_ = ::fanotify_init(FAN_CLASS_NOTIF | FAN_CLOEXEC | FAN_NONBLOCK, O_RDONLY | O_LARGEFILE);
  if (fd_ < 0) {
    RW_LOG_INFO("FanotifyAttributor", "fanotify unavailable (%s); file events stay unattributed", std::strerror(errno));
    return false;
  }
  int marked = 0;
  for (const auto& root : roots) {
    if (::fanotify_mark(fd_, FAN_MARK_ADD | FAN_MARK_MOUNT, FAN_MODIFY | FAN_CLOSE_WRITE, AT_FDCWD, root.c_str()) < 0) {
      RW_LOG_WARN("FanotifyAttributor", "cannot mark mount of %s: %s", root.c_str(), std::strerror(errno));
      continue;
    }
    ++marked;
  }
  if (marked == 0) {
    ::close(fd_); fd_ = -1;
    return false;
  }
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
  RW_LOG_INFO("FanotifyAttributor", "attributing writes on %d mount(s)", marked);
  return true;
}

void FanotifyAttributor::stop() {
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }
  if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
}

std::optional<int32_t> FanotifyAttributor::lookup(const std::string& path) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = last_writer_.find(path);
  if (it == last_writer_.end()) return std::nullopt;
  return it->second;
}

void FanotifyAttributor::record(const std::string& path, int32_t pid) {
  std::lock_guard<std::mutex> lk(mu_);
  if (last_writer_.size() >= kMaxPaths && last_writer_.find(path) == last_writer_.end()) last_writer_.clear();
  last_writer_[path] = pid;
}

void FanotifyAttributor::run(std::stop_token st) {
  const int32_t self = static_cast<int32_t>(::getpid());
  alignas(struct fanotify_event_metadata) char buffer[8192];
  while (!st.stop_requested()) {
    struct pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
    int pr = ::poll(&pfd, 1, 200);
    if (pr < 0) {
      if (errno == EINTR) continue;
      RW_LOG_ERROR("FanotifyAttributor", "poll failed: %s", std::strerror(errno));
      return;
    }
    if (pr == 0) continue;
    ssize_t len = ::read(fd_, buffer, sizeof(buffer));
    if (len < 0) {
      if (errno == EAGAIN || errno == EINTR) continue;
      RW_LOG_ERROR("FanotifyAttributor", "read failed: %s", std::strerror(errno));
      return;
    }
    auto* md = reinterpret_cast<struct fanotify_event_metadata*>(buffer);
    while (FAN_EVENT_OK(md, len)) {
      if (md->vers != FANOTIFY_METADATA_VERSION) {
        RW_LOG_ERROR("FanotifyAttributor", "metadata version mismatch");
        return;
      }
      if (md->fd >= 0) {
        if (md->pid != self) {
          char link[64];
          std::snprintf(link, sizeof(link), "/proc/self/fd/%d", md->fd);
          char path[PATH_MAX];
          ssize_t n = ::readlink(link, path, sizeof(path) - 1);
          if (n > 0) {
            path[n] = '\0';
            record(path, static_cast<int32_t>(md->pid));
          }
        }
        ::close(md->fd);
      }
      md = FAN_EVENT_NEXT(md, len);
    }
  }
}

} // namespace ransomwatch::collectors
