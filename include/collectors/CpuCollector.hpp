#pragma once
#include "model/Cpu.hpp"

namespace ransomwatch::collectors {

// Aggregate CPU utilization from /proc/stat deltas. The first call
// establishes the baseline and reports 0%.
class CpuCollector {
public:
  CpuCollector() = default;
  bool sample(ransomwatch::model::CpuSample& out);
private:
  ransomwatch::model::CpuTimes last_total_{};
  bool has_last_{false};
};

// Number of cpuN lines in /proc/stat (at least 1).
[[nodiscard]] int read_logical_cpu_count();

} // namespace ransomwatch::collectors
