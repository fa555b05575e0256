#pragma once
#include "app/Clock.hpp"
#include "app/TrainedModel.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <stop_token>
#include <vector>

namespace ransomwatch::app {

struct TrainerOptions {
  double contamination{0.1};
  size_t min_samples{10};
  ForestParams forest{};
};

// Fits the scaler and isolation forest on an unlabeled baseline.
class BaselineTrainer {
public:
  using SampleFn = std::function<std::optional<ransomwatch::model::FeatureVector>()>;

  explicit BaselineTrainer(TrainerOptions opts);

  // Calls next_sample once per interval for `duration` (ticks at
  // start + k*interval while before start + duration). A nullopt sample is
  // a failed tick and is skipped. The collected rows are returned through
  // `baseline` when given. Throws InsufficientDataError, or
  // TrainingCancelledError when `st` fires before the window elapsed.
  [[nodiscard]] TrainedModel train(std::chrono::milliseconds duration, std::chrono::milliseconds interval,
                                   IClock& clock, const SampleFn& next_sample, const std::stop_token& st,
                                   std::vector<ransomwatch::model::FeatureVector>* baseline = nullptr) const;

  // Fit on rows already collected. Throws InsufficientDataError.
  [[nodiscard]] TrainedModel fit(const std::vector<ransomwatch::model::FeatureVector>& rows,
                                 std::chrono::milliseconds interval) const;

  // Linear-interpolated percentile (0..100) of unsorted values.
  [[nodiscard]] static double percentile(std::vector<double> values, double pct);

private:
  TrainerOptions opts_;
};

} // namespace ransomwatch::app
