#pragma once
#include "collectors/FanotifyAttributor.hpp"
#include "collectors/IFileActivityCollector.hpp"
#include "util/Log.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace ransomwatch::collectors {

struct InotifyOptions {
  std::vector<std::string> roots;
  size_t max_watches{8192};
  size_t max_events{10000};   // stored per window; counts stay exact beyond it
};

// Recursive inotify watcher. A background thread drains the inotify fd
// into the pending batch; sample() swaps it out.
//  - modify/close_write coalesce to one Modified per path per window
//  - MOVED_FROM/MOVED_TO with the same cookie become one Renamed; an
//    unpaired MOVED_FROM is a Deleted, an unpaired MOVED_TO a Created
//  - new directories are watched as they appear, up to max_watches
class InotifyFileCollector : public IFileActivityCollector {
public:
  explicit InotifyFileCollector(InotifyOptions opts, FanotifyAttributor* attributor = nullptr);
  ~InotifyFileCollector() override;
  InotifyFileCollector(const InotifyFileCollector&) = delete;
  InotifyFileCollector& operator=(const InotifyFileCollector&) = delete;

  // Throws CollectorUnavailable when inotify cannot be initialized or no
  // root could be watched. Batches are flagged unavailable once the
  // reader thread died or every watched directory is gone.
  void start();
  void stop();

  ransomwatch::model::FileActivityBatch sample() override;
  const char* name() const override { return "inotify"; }
  [[nodiscard]] size_t watch_count() const;

private:
  struct PendingMove { std::string path; bool is_dir{false}; };

  void run(std::stop_token st);
  void handle_event(int wd, uint32_t mask, uint32_t cookie, const std::string& name);
  void add_watch_recursive(const std::string& dir);
  bool add_watch(const std::string& dir);
  void forget_watches_under(const std::string& dir);
  void rename_watches(const std::string& from, const std::string& to);
  void flush_pending_moves();
  void emit(ransomwatch::model::FileEventKind kind, std::string path, std::string old_path = {});

  InotifyOptions opts_;
  FanotifyAttributor* attributor_{nullptr};
  int fd_{-1};
  std::jthread thread_;

  mutable std::mutex mu_;
  ransomwatch::model::FileActivityBatch pending_{};
  std::unordered_set<std::string> modified_seen_;
  std::unordered_map<int, std::string> watches_;
  std::unordered_map<uint32_t, PendingMove> moves_;
  bool watch_cap_logged_{false};
  bool unavailable_logged_{false};
  std::atomic<bool> worker_failed_{false};
  ransomwatch::util::LogThrottle overflow_warn_{};
};

// Opens the inotify backend for `opts.roots`, falling back to a
// NullFileCollector (logged) when it is unavailable.
[[nodiscard]] std::unique_ptr<IFileActivityCollector> make_file_collector(InotifyOptions opts,
                                                                          FanotifyAttributor* attributor);

} // namespace ransomwatch::collectors
