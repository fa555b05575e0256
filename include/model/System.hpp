#pragma once
#include <chrono>
#include <cstdint>

namespace ransomwatch::model {

struct MemorySample {
  uint64_t total_kb{};
  uint64_t used_kb{};
  double used_pct{};
};

// Cumulative byte counters summed over physical block devices
struct DiskCounters {
  uint64_t read_bytes{};
  uint64_t write_bytes{};
  int devices{0};
};

// Point-in-time system snapshot. Disk byte fields are cumulative; the
// *_bps fields are filled in by the FeatureAggregator once a previous
// snapshot exists (has_rates).
struct SystemMetrics {
  double cpu_pct{};
  double mem_pct{};
  uint64_t disk_read_bytes{};
  uint64_t disk_write_bytes{};
  double disk_read_bps{};
  double disk_write_bps{};
  bool has_rates{false};

  // false when the value was never obtained (unavailable sentinel)
  bool has_cpu{false};
  bool has_mem{false};
  bool has_disk{false};

  std::chrono::steady_clock::time_point sampled_at{};
  int64_t timestamp_ms{};   // wall clock, ms since epoch
};

} // namespace ransomwatch::model
