#pragma once
#include "model/System.hpp"
#include <string>
#include <vector>

namespace ransomwatch::collectors {

// Sums cumulative sectors read/written over physical block devices in
// /proc/diskstats. Rates are derived downstream by the FeatureAggregator.
class DiskCollector {
public:
  bool sample(ransomwatch::model::DiskCounters& out) const;

  // Virtual devices (loop, ram, dm-, md, zram, sr) and partitions of a
  // listed parent device are excluded. `names` is every device in the file.
  [[nodiscard]] static bool is_physical(const std::string& name, const std::vector<std::string>& names);
private:
  static constexpr uint64_t kSectorSize = 512; // diskstats always counts 512-byte units
};

} // namespace ransomwatch::collectors
