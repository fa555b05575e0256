#include "collectors/SystemCollector.hpp"

namespace ransomwatch::collectors {

ransomwatch::model::SystemMetrics SystemCollector::sample() {
  ransomwatch::model::SystemMetrics m{};

  ransomwatch::model::CpuSample cs{};
  if (cpu_.sample(cs)) last_cpu_ = cs;
  else if (cpu_warn_.allow()) RW_LOG_WARN("SystemCollector", "/proc/stat unreadable, reusing last CPU value");
  if (last_cpu_) { m.cpu_pct = last_cpu_->usage_pct; m.has_cpu = true; }

  ransomwatch::model::MemorySample ms{};
  if (mem_.sample(ms)) last_mem_ = ms;
  else if (mem_warn_.allow()) RW_LOG_WARN("SystemCollector", "/proc/meminfo unreadable, reusing last memory value");
  if (last_mem_) { m.mem_pct = last_mem_->used_pct; m.has_mem = true; }

  ransomwatch::model::DiskCounters dc{};
  if (disk_.sample(dc)) last_disk_ = dc;
  else if (disk_warn_.allow()) RW_LOG_WARN("SystemCollector", "/proc/diskstats unreadable, reusing last disk counters");
  if (last_disk_) {
    m.disk_read_bytes = last_disk_->read_bytes;
    m.disk_write_bytes = last_disk_->write_bytes;
    m.has_disk = true;
  }
  return m;
}

} // namespace ransomwatch::collectors
