#pragma once
#include "model/Features.hpp"
#include "model/FileActivity.hpp"
#include "model/Process.hpp"
#include "model/System.hpp"
#include <string>
#include <vector>

namespace ransomwatch::model {

// One per detection tick. Handed out by value or as shared_ptr<const>.
struct DetectionResult {
  uint64_t tick{};
  SystemMetrics metrics{};
  FeatureVector features{};
  bool is_anomaly{false};
  double score{};           // negative = anomalous side of the model offset
  double cutoff{};          // flagged when score < cutoff
  double raw_score{};       // isolation score in [-1, 0]
  bool suppressed{false};   // statistically flagged but below the noise floors
  std::vector<ProcessInfo> suspicious;   // highest suspicion first
  std::vector<std::string> factors;      // feature names outside the baseline
  std::array<uint64_t, kFileEventKinds> file_counts{};
  bool file_overflow{false};
  bool file_available{true};  // false: file rates were not observed this tick
  int64_t timestamp_ms{};
};

} // namespace ransomwatch::model
