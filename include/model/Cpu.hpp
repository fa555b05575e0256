#pragma once
#include <cstdint>

namespace ransomwatch::model {

struct CpuTimes {
  uint64_t user{}, nice{}, system{}, idle{}, iowait{}, irq{}, softirq{}, steal{};
  uint64_t total() const { return user + nice + system + idle + iowait + irq + softirq + steal; }
  uint64_t work()  const { return user + nice + system + irq + softirq + steal; }
};

struct CpuSample {
  CpuTimes total_times{};
  double usage_pct{};        // aggregate percent 0..100
  int logical_cpus{0};       // cpuN lines in /proc/stat
};

} // namespace ransomwatch::model
