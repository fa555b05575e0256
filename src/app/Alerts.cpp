#include "app/Alerts.hpp"
#include <cstdio>

namespace ransomwatch::app {

AlertEngine::AlertEngine(AlertRules rules) : rules_(rules) {}

std::vector<Alert> AlertEngine::evaluate(const ransomwatch::model::DetectionResult& r,
                                         std::chrono::steady_clock::time_point now) {
  std::vector<Alert> out;
  if (r.is_anomaly) {
    if (!raised_ || now - last_anomaly_alert_ >= rules_.cooldown) {
      char buf[160];
      if (!r.suspicious.empty()) {
        const auto& top = r.suspicious.front();
        std::snprintf(buf, sizeof(buf), "Anomalous activity (score %.3f), top process %s [%d]",
                      r.score, top.name.c_str(), top.pid);
      } else {
        std::snprintf(buf, sizeof(buf), "Anomalous activity (score %.3f)", r.score);
      }
      out.push_back({"crit", buf});
      last_anomaly_alert_ = now;
      raised_ = true;
    } else {
      ++suppressed_;
    }
  }
  if (r.file_overflow) out.push_back({"warn", "File event queue overflowed; counts are a lower bound"});
  if (!r.file_available && files_available_)
    out.push_back({"warn", "File activity is not monitored; file rates read as zero"});
  files_available_ = r.file_available;
  return out;
}

} // namespace ransomwatch::app
