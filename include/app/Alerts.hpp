#pragma once
#include "model/Detection.hpp"
#include <string>
#include <vector>
#include <chrono>

namespace ransomwatch::app {

struct Alert {
  std::string severity; // info|warn|crit
  std::string message;
};

struct AlertRules {
  std::chrono::seconds cooldown = std::chrono::seconds(300);  // between repeated anomaly alerts
};

// Presentation-side alerting. Never feeds back into the verdict.
class AlertEngine {
public:
  explicit AlertEngine(AlertRules rules = {});
  // May return empty for a quiet tick.
  std::vector<Alert> evaluate(const ransomwatch::model::DetectionResult& r,
                              std::chrono::steady_clock::time_point now);
  [[nodiscard]] size_t suppressed() const { return suppressed_; }
private:
  AlertRules rules_;
  std::chrono::steady_clock::time_point last_anomaly_alert_{};
  bool raised_{false};
  bool files_available_{true};  // raise the unavailable warning on the transition only
  size_t suppressed_{0};
};

} // namespace ransomwatch::app
