#pragma once
#include "app/OnlineAnalyzer.hpp"
#include "app/TrainedModel.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ransomwatch::app {

struct ModelCheck {
  std::vector<std::string> problems;   // empty when the model is usable
  std::optional<Verdict> live;         // verdict on the live vector, when one was scored
  [[nodiscard]] bool ok() const { return problems.empty(); }
};

// Checks a persisted model before it is trusted: schema, sampling
// interval, finite scaler and baseline statistics, well-formed trees and
// a calibrated offset. When `live` is given and the structure is sound,
// it is scored once through an OnlineAnalyzer and the score must be
// finite with an isolation score in [-1, 0].
[[nodiscard]] ModelCheck validate_model(const std::shared_ptr<const TrainedModel>& model,
                                        std::chrono::milliseconds interval, const Thresholds& thresholds,
                                        const ransomwatch::model::FeatureVector* live = nullptr);

} // namespace ransomwatch::app
