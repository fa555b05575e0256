#pragma once
#include "model/Process.hpp"

namespace ransomwatch::collectors {

// Interface for process collectors so the detector can run against
// /proc or a fake in tests.
class IProcessCollector {
public:
  virtual ~IProcessCollector() = default;

  // Initialize collector. Return false if unavailable (permissions, platform).
  [[nodiscard]] virtual bool init() { return true; }

  // Current process table. Processes that vanish mid-scan are skipped.
  [[nodiscard]] virtual ransomwatch::model::ProcessSnapshot sample() = 0;

  virtual void shutdown() {}

  // Human-friendly name for diagnostics
  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace ransomwatch::collectors
