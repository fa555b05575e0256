#include "collectors/InotifyFileCollector.hpp"
#include "app/Errors.hpp"

#include <sys/inotify.h>
#include <sys/stat.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>

namespace fs = std::filesystem;
using ransomwatch::model::FileEventKind;

namespace ransomwatch::collectors {

static constexpr uint32_t kWatchMask =
    IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_DELETE | IN_MOVED_FROM | IN_MOVED_TO |
    IN_DELETE_SELF | IN_ONLYDIR | IN_EXCL_UNLINK;

static int64_t wall_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
}

InotifyFileCollector::InotifyFileCollector(InotifyOptions opts, FanotifyAttributor* attributor)
  : opts_(std::move(opts)), attributor_(attributor) {}

InotifyFileCollector::~InotifyFileCollector() { stop(); }

void InotifyFileCollector::start() {
  if (fd_ >= 0) return;
  fd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
  if (fd_ < 0) throw ransomwatch::app::CollectorUnavailable(std::string("inotify_init1: ") + std::strerror(errno));
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& root : opts_.roots) add_watch_recursive(root);
    if (watches_.empty()) {
      ::close(fd_); fd_ = -1;
      throw ransomwatch::app::CollectorUnavailable("no monitored directory could be watched");
    }
    RW_LOG_INFO("InotifyFileCollector", "watching %zu directories under %zu root(s)", watches_.size(), opts_.roots.size());
  }
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void InotifyFileCollector::stop() {
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }
  if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
}

size_t InotifyFileCollector::watch_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return watches_.size();
}

bool InotifyFileCollector::add_watch(const std::string& dir) {
  if (watches_.size() >= opts_.max_watches) {
    if (!watch_cap_logged_) {
      RW_LOG_WARN("InotifyFileCollector", "watch limit %zu reached; deeper directories are not monitored", opts_.max_watches);
      watch_cap_logged_ = true;
    }
    return false;
  }
  int wd = ::inotify_add_watch(fd_, dir.c_str(), kWatchMask);
  if (wd < 0) {
    RW_LOG_DEBUG("InotifyFileCollector", "cannot watch %s: %s", dir.c_str(), std::strerror(errno));
    return false;
  }
  watches_[wd] = dir;
  return true;
}

void InotifyFileCollector::add_watch_recursive(const std::string& dir) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) return;
  if (!add_watch(dir)) return;
  fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec), end;
  while (!ec && it != end) {
    const auto& entry = *it;
    std::error_code ec2;
    if (entry.is_directory(ec2) && !entry.is_symlink(ec2)) {
      if (!add_watch(entry.path().string())) { it.disable_recursion_pending(); }
    }
    it.increment(ec);
  }
}

void InotifyFileCollector::forget_watches_under(const std::string& dir) {
  const std::string prefix = dir + "/";
  for (auto it = watches_.begin(); it != watches_.end(); ) {
    if (it->second == dir || it->second.rfind(prefix, 0) == 0) {
      ::inotify_rm_watch(fd_, it->first);
      it = watches_.erase(it);
    } else {
      ++it;
    }
  }
}

void InotifyFileCollector::rename_watches(const std::string& from, const std::string& to) {
  const std::string prefix = from + "/";
  for (auto& [wd, path] : watches_) {
    if (path == from) path = to;
    else if (path.rfind(prefix, 0) == 0) path = to + path.substr(from.size());
  }
}

void InotifyFileCollector::emit(FileEventKind kind, std::string path, std::string old_path) {
  ransomwatch::model::FileActivity ev{};
  ev.kind = kind;
  ev.path = std::move(path);
  ev.old_path = std::move(old_path);
  ev.timestamp_ms = wall_ms();
  pending_.add(std::move(ev), opts_.max_events);
}

void InotifyFileCollector::flush_pending_moves() {
  for (auto& [cookie, mv] : moves_) {
    if (mv.is_dir) forget_watches_under(mv.path);
    emit(FileEventKind::Deleted, std::move(mv.path));
  }
  moves_.clear();
}

void InotifyFileCollector::handle_event(int wd, uint32_t mask, uint32_t cookie, const std::string& name) {
  if (mask & IN_Q_OVERFLOW) {
    pending_.overflowed = true;
    if (overflow_warn_.allow()) RW_LOG_WARN("InotifyFileCollector", "event queue overflowed; file counts are a lower bound");
    return;
  }
  if (mask & IN_IGNORED) { watches_.erase(wd); return; }
  auto dir = watches_.find(wd);
  if (dir == watches_.end()) return;
  if (mask & IN_DELETE_SELF) return; // parent reports IN_DELETE
  const bool is_dir = (mask & IN_ISDIR) != 0;
  std::string path = name.empty() ? dir->second : dir->second + "/" + name;

  if (mask & IN_MOVED_TO) {
    auto mv = moves_.find(cookie);
    if (mv != moves_.end()) {
      std::string old_path = std::move(mv->second.path);
      moves_.erase(mv);
      if (is_dir) rename_watches(old_path, path);
      emit(FileEventKind::Renamed, std::move(path), std::move(old_path));
    } else {
      if (is_dir) add_watch_recursive(path);
      emit(FileEventKind::Created, std::move(path));
    }
    return;
  }
  flush_pending_moves();

  if (mask & IN_MOVED_FROM) {
    moves_[cookie] = PendingMove{std::move(path), is_dir};
  } else if (mask & IN_CREATE) {
    if (is_dir) add_watch_recursive(path);
    emit(FileEventKind::Created, std::move(path));
  } else if (mask & IN_DELETE) {
    modified_seen_.erase(path);
    emit(FileEventKind::Deleted, std::move(path));
  } else if (mask & (IN_MODIFY | IN_CLOSE_WRITE)) {
    if (is_dir) return;
    if (!modified_seen_.insert(path).second) return;
    emit(FileEventKind::Modified, std::move(path));
  }
}

void InotifyFileCollector::run(std::stop_token st) {
  alignas(struct inotify_event) char buffer[64 * 1024];
  while (!st.stop_requested()) {
    struct pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
    int pr = ::poll(&pfd, 1, 200);
    if (pr < 0) {
      if (errno == EINTR) continue;
      RW_LOG_ERROR("InotifyFileCollector", "poll failed: %s; file activity is no longer monitored", std::strerror(errno));
      worker_failed_.store(true);
      return;
    }
    if (pr == 0) continue;
    ssize_t len = ::read(fd_, buffer, sizeof(buffer));
    if (len < 0) {
      if (errno == EAGAIN || errno == EINTR) continue;
      RW_LOG_ERROR("InotifyFileCollector", "read failed: %s; file activity is no longer monitored", std::strerror(errno));
      worker_failed_.store(true);
      return;
    }
    std::lock_guard<std::mutex> lk(mu_);
    for (char* ptr = buffer; ptr < buffer + len; ) {
      auto* ev = reinterpret_cast<struct inotify_event*>(ptr);
      std::string name = ev->len > 0 ? std::string(ev->name) : std::string();
      handle_event(ev->wd, ev->mask, ev->cookie, name);
      ptr += sizeof(struct inotify_event) + ev->len;
    }
  }
}

ransomwatch::model::FileActivityBatch InotifyFileCollector::sample() {
  ransomwatch::model::FileActivityBatch out{};
  {
    std::lock_guard<std::mutex> lk(mu_);
    flush_pending_moves();
    out = std::move(pending_);
    pending_ = ransomwatch::model::FileActivityBatch{};
    modified_seen_.clear();
    out.available = fd_ >= 0 && !worker_failed_.load() && !watches_.empty();
    if (!out.available && !unavailable_logged_) {
      RW_LOG_WARN("InotifyFileCollector", "no directory is watched any more; file rates read as unavailable");
      unavailable_logged_ = true;
    }
  }
  // sizes and writers are resolved after the window closes
  for (auto& ev : out.events) {
    if (ev.kind == FileEventKind::Deleted) continue;
    struct stat sb{};
    if (::stat(ev.path.c_str(), &sb) == 0 && S_ISREG(sb.st_mode)) ev.size = static_cast<int64_t>(sb.st_size);
    if (attributor_) ev.pid = attributor_->lookup(ev.path);
  }
  return out;
}

std::unique_ptr<IFileActivityCollector> make_file_collector(InotifyOptions opts, FanotifyAttributor* attributor) {
  auto c = std::make_unique<InotifyFileCollector>(std::move(opts), attributor);
  try {
    c->start();
  } catch (const ransomwatch::app::CollectorUnavailable& e) {
    RW_LOG_WARN("InotifyFileCollector", "file activity unavailable: %s", e.what());
    return std::make_unique<NullFileCollector>();
  }
  return c;
}

} // namespace ransomwatch::collectors
