#pragma once
#include "collectors/IProcessCollector.hpp"
#include <chrono>
#include <string>
#include <unordered_map>

namespace ransomwatch::collectors {

// /proc scanner. Per-process CPU is the jiffies delta against the
// aggregate CPU delta, scaled to percent of one core. Per-process I/O is
// the read_bytes+write_bytes delta of /proc/<pid>/io over wall time.
class ProcessCollector : public IProcessCollector {
public:
  explicit ProcessCollector(size_t max_procs = 4096);
  const char* name() const override { return "procfs process scanner"; }
  ransomwatch::model::ProcessSnapshot sample() override;

  static bool parse_stat_line(const std::string& content, uint64_t& utime, uint64_t& stime,
                              int64_t& rss_pages, std::string& comm);
  static bool parse_io(const std::string& content, uint64_t& read_bytes, uint64_t& write_bytes);
private:
  struct Prev { uint64_t cpu_time{}; uint64_t io_bytes{}; bool has_io{false}; };
  std::unordered_map<int32_t, Prev> last_{};
  uint64_t last_cpu_total_{};
  std::chrono::steady_clock::time_point last_run_{};
  bool have_last_{false};
  size_t max_procs_{};
  unsigned ncpu_{0};

  static std::string user_from_status(int32_t pid);
};

} // namespace ransomwatch::collectors
