#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace ransomwatch::model {

// Recreated every tick. A pid is an opaque key for the tick it was
// sampled in and may be reused by another process on the next one.
struct ProcessInfo {
  int32_t pid{};
  std::string name;
  std::string user;         // empty when unknown
  double cpu_pct{};         // percent of one core (may exceed 100 for threaded work)
  double io_bps{};          // read+write bytes/s from /proc/<pid>/io
  bool has_io{false};
  uint64_t rss_kb{};

  // filled by the FeatureAggregator
  uint32_t file_writes{};   // attributed file events in the tick window
  double suspicion{};       // composite ranking score
};

struct ProcessSnapshot {
  std::vector<ProcessInfo> processes;
  size_t total_processes{};
  size_t vanished{};        // pids that disappeared mid-scan
};

} // namespace ransomwatch::model
