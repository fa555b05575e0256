#pragma once
#include "app/IsolationForest.hpp"
#include "model/Features.hpp"

#include <array>
#include <chrono>
#include <cstdint>

namespace ransomwatch::app {

struct FeatureStats {
  double min{};
  double max{};
  double mean{};
  double std{};
};

// Produced once by the BaselineTrainer and shared read-only (as
// shared_ptr<const TrainedModel>) for the rest of the run.
struct TrainedModel {
  int schema_version{ransomwatch::model::kFeatureSchemaVersion};
  size_t feature_count{ransomwatch::model::kFeatureCount};
  std::chrono::milliseconds interval{};    // tick interval the rates were sampled at
  double contamination{0.1};
  size_t samples{};
  int64_t trained_at_ms{};

  StandardScaler scaler{};
  IsolationForest forest{};
  double offset{};                         // contamination percentile of training scores
  double train_score_mean{};
  double train_score_std{};
  std::array<FeatureStats, ransomwatch::model::kFeatureCount> stats{};
};

} // namespace ransomwatch::app
