#pragma once
#include "collectors/ISystemCollector.hpp"
#include "collectors/CpuCollector.hpp"
#include "collectors/DiskCollector.hpp"
#include "collectors/MemoryCollector.hpp"
#include "util/Log.hpp"
#include <optional>

namespace ransomwatch::collectors {

class SystemCollector : public ISystemCollector {
public:
  SystemCollector() = default;
  [[nodiscard]] ransomwatch::model::SystemMetrics sample() override;
  [[nodiscard]] const char* name() const override { return "procfs system collector"; }
private:
  CpuCollector cpu_{};
  MemoryCollector mem_{};
  DiskCollector disk_{};
  std::optional<ransomwatch::model::CpuSample> last_cpu_;
  std::optional<ransomwatch::model::MemorySample> last_mem_;
  std::optional<ransomwatch::model::DiskCounters> last_disk_;
  ransomwatch::util::LogThrottle cpu_warn_{}, mem_warn_{}, disk_warn_{};
};

} // namespace ransomwatch::collectors
