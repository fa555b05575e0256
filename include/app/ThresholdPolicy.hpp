#pragma once
#include <cstdint>
#include <string>

namespace ransomwatch::app {

enum class DiskClass { Unknown, Hdd, Ssd, Nvme };
[[nodiscard]] const char* disk_class_name(DiskClass c);

// Host capacity read once at startup.
struct HostProfile {
  int cpu_count{1};
  uint64_t mem_total_kb{};
  DiskClass disk_class{DiskClass::Unknown};
  std::string disk_device;   // fastest physical device found

  // /proc/stat, /proc/meminfo and /sys/block/*/queue/rotational
  [[nodiscard]] static HostProfile discover();
};

struct ThresholdOptions {
  double disk_reference_mbps{0.0};     // 0 = derive from disk class
  double file_event_reference{100.0};  // events/s treated as full scale
  double high_process_cpu_pct{85.0};
  double score_margin{0.0};
  double score_std_margin{2.0};        // cutoff widening, in training-score std units
  double range_tolerance{1.0};
};

// Immutable, host-relative decision parameters shared by the aggregator
// and the analyzer.
struct Thresholds {
  double disk_reference_bps{};
  double file_event_reference{};
  double high_process_cpu_pct{};
  double cpu_noise_floor_pct{};
  double disk_noise_floor_bps{};
  double file_noise_floor_per_s{};
  double score_margin{};
  double score_std_margin{};
  double range_tolerance{};
  int cpu_count{1};
};

inline constexpr double kMiB = 1024.0 * 1024.0;

[[nodiscard]] double disk_reference_mbps(DiskClass c);
[[nodiscard]] Thresholds derive_thresholds(const HostProfile& host, const ThresholdOptions& opts);

} // namespace ransomwatch::app
