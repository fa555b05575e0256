#pragma once
#include "app/ThresholdPolicy.hpp"
#include "app/Whitelist.hpp"
#include "model/Features.hpp"
#include "model/FileActivity.hpp"
#include "model/Process.hpp"
#include "model/System.hpp"

#include <chrono>
#include <optional>
#include <vector>

namespace ransomwatch::app {

// Suspicion ranking weights (cpu, I/O, attributed file writes). Pending
// product calibration, so they come from configuration.
struct RankingWeights {
  double cpu{0.3};
  double io{0.4};
  double files{0.3};
};

struct AggregatorOptions {
  std::chrono::milliseconds nominal_interval{5000};  // file-rate window before a previous tick exists
  size_t top_n{5};
  RankingWeights weights{};
};

// Raw collector output for one tick.
struct TickInput {
  ransomwatch::model::SystemMetrics system;
  ransomwatch::model::ProcessSnapshot processes;
  ransomwatch::model::FileActivityBatch files;
};

struct AggregatedTick {
  ransomwatch::model::SystemMetrics metrics;   // with rates filled in
  ransomwatch::model::FeatureVector features{};
  std::vector<ransomwatch::model::ProcessInfo> suspicious;
  std::array<uint64_t, ransomwatch::model::kFileEventKinds> file_counts{};
  bool file_overflow{false};
  bool file_available{true};
  double window_seconds{};
};

// Bytes/s between two cumulative readings. A counter that went backwards
// (device removed, wrap) yields 0; a non-positive elapsed time yields
// `fallback` (the previous rate).
[[nodiscard]] double counter_rate(uint64_t prev, uint64_t cur, double elapsed_s, double fallback);

// Turns raw collector output into a FeatureVector and the suspicious
// process ranking. Owns the previous snapshot used for rate conversion.
class FeatureAggregator {
public:
  FeatureAggregator(Thresholds thresholds, AggregatorOptions opts, ProcessWhitelist whitelist = {});

  [[nodiscard]] AggregatedTick aggregate(TickInput in);

  // True once a previous snapshot exists and rates are defined.
  [[nodiscard]] bool primed() const { return prev_.has_value(); }
  void reset() { prev_.reset(); }

private:
  std::vector<ransomwatch::model::ProcessInfo> rank(const ransomwatch::model::ProcessSnapshot& procs,
                                                    const ransomwatch::model::FileActivityBatch& files,
                                                    double window_s) const;

  Thresholds th_;
  AggregatorOptions opts_;
  ProcessWhitelist whitelist_;
  std::optional<ransomwatch::model::SystemMetrics> prev_;
};

} // namespace ransomwatch::app
