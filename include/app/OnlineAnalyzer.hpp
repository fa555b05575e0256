#pragma once
#include "app/ThresholdPolicy.hpp"
#include "app/TrainedModel.hpp"

#include <memory>
#include <string>
#include <vector>

namespace ransomwatch::app {

struct Verdict {
  bool is_anomaly{false};
  double score{};          // decision minus range excess; negative = anomalous side
  double raw_score{};      // isolation score in [-1, 0]
  double range_excess{};
  double cutoff{};         // flagged below this score
  bool suppressed{false};  // flagged, then cleared by the noise floors
  std::vector<std::string> factors;
};

// Scores one FeatureVector against the published model. Holds no state
// besides the model handle.
//   score = (s(x) - offset) - sum_f max(0, (x_f - upper_f) / width_f)
//   upper_f = max_f + range_tolerance * width_f, width_f = max(range_f, floor_f)
// The verdict is score < -(score_margin + score_std_margin * train_score_std),
// cleared when every activity feature sits below its host noise floor.
class OnlineAnalyzer {
public:
  explicit OnlineAnalyzer(Thresholds thresholds);

  void set_model(std::shared_ptr<const TrainedModel> model) { model_ = std::move(model); }
  [[nodiscard]] bool has_model() const { return model_ != nullptr; }

  // Throws ModelNotTrainedError when no model is published.
  [[nodiscard]] Verdict score(const ransomwatch::model::FeatureVector& x) const;

  // Noise floor of feature f in feature units.
  [[nodiscard]] double noise_floor(size_t f) const;

private:
  Thresholds th_;
  std::shared_ptr<const TrainedModel> model_;
};

} // namespace ransomwatch::app
