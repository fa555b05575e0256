#pragma once

#include "app/Alerts.hpp"
#include "app/Detector.hpp"
#include "app/ModelValidator.hpp"
#include "model/Detection.hpp"
#include <string>
#include <vector>

namespace ransomwatch::ui {

// Plain-text status block for one detection tick.
std::string render_status(const ransomwatch::model::DetectionResult& r,
                          const std::vector<ransomwatch::app::Alert>& alerts,
                          ransomwatch::app::DetectorState state);

// One-line training summary printed once the model is ready.
std::string render_model_summary(const ransomwatch::app::TrainedModel& m);

// Result of --validate-model.
std::string render_model_check(const ransomwatch::app::ModelCheck& c);

} // namespace ransomwatch::ui
