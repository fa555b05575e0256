#pragma once
#include "model/System.hpp"

namespace ransomwatch::collectors {

// System-wide CPU, memory and cumulative disk counters. sample() never
// throws for missing data: values that could not be read are reused from
// the previous call, or flagged via has_* when never obtained.
class ISystemCollector {
public:
  virtual ~ISystemCollector() = default;
  [[nodiscard]] virtual ransomwatch::model::SystemMetrics sample() = 0;
  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace ransomwatch::collectors
