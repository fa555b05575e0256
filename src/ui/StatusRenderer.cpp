#include "ui/StatusRenderer.hpp"
#include "ui/Formatting.hpp"
#include <cstdio>
#include <sstream>

namespace ransomwatch::ui {

std::string render_status(const ransomwatch::model::DetectionResult& r,
                          const std::vector<ransomwatch::app::Alert>& alerts,
                          ransomwatch::app::DetectorState state) {
  using namespace ransomwatch::model;
  std::ostringstream os;
  char line[160];

  os << "[" << format_timestamp(r.timestamp_ms) << "] tick " << r.tick
     << " (" << ransomwatch::app::state_name(state) << ")\n";

  std::snprintf(line, sizeof(line), "  CPU %5.1f%%  MEM %5.1f%%  ", r.metrics.cpu_pct, r.metrics.mem_pct);
  os << line << "disk R " << format_rate(r.metrics.disk_read_bps)
     << "  W " << format_rate(r.metrics.disk_write_bps) << "\n";

  os << "  files";
  for (size_t k = 0; k < kFileEventKinds; ++k)
    os << "  " << file_event_kind_name(static_cast<FileEventKind>(k)) << " " << r.file_counts[k];
  if (r.file_overflow) os << "  (overflow)";
  if (!r.file_available) os << "  (unavailable)";
  os << "\n";

  const char* verdict = r.is_anomaly ? "ANOMALY" : (r.suppressed ? "normal (below noise floor)" : "normal");
  std::snprintf(line, sizeof(line), "  score %+.4f  cutoff %+.4f  isolation %.4f  -> %s\n",
                r.score, r.cutoff, r.raw_score, verdict);
  os << line;

  if (!r.factors.empty()) {
    os << "  factors:";
    for (const auto& f : r.factors) os << " " << f;
    os << "\n";
  }

  if (!r.suspicious.empty()) {
    os << "  " << rpad_trunc("PID", 7) << "  " << trunc_pad("NAME", 16) << "  "
       << rpad_trunc("CPU%", 6) << "  " << rpad_trunc("I/O", 12) << "  " << rpad_trunc("WRITES", 6)
       << "  SCORE\n";
    for (const auto& p : r.suspicious) {
      std::snprintf(line, sizeof(line), "%.1f", p.cpu_pct);
      os << "  " << rpad_trunc(std::to_string(p.pid), 7) << "  " << trunc_pad(p.name, 16) << "  "
         << rpad_trunc(line, 6) << "  " << rpad_trunc(p.has_io ? format_rate(p.io_bps) : "-", 12) << "  "
         << rpad_trunc(std::to_string(p.file_writes), 6) << "  ";
      std::snprintf(line, sizeof(line), "%.3f", p.suspicion);
      os << line << "\n";
    }
  }

  for (const auto& a : alerts) os << "  [" << a.severity << "] " << a.message << "\n";
  return os.str();
}

std::string render_model_summary(const ransomwatch::app::TrainedModel& m) {
  char line[200];
  std::snprintf(line, sizeof(line),
                "model: %zu samples at %lld ms, %zu trees, contamination %.3f, offset %.4f (trained %s)",
                m.samples, static_cast<long long>(m.interval.count()), m.forest.trees().size(),
                m.contamination, m.offset, format_timestamp(m.trained_at_ms).c_str());
  return line;
}

std::string render_model_check(const ransomwatch::app::ModelCheck& c) {
  std::ostringstream os;
  os << "model check: " << (c.ok() ? "valid" : "INVALID") << "\n";
  for (const auto& p : c.problems) os << "  - " << p << "\n";
  if (c.live) {
    char line[160];
    std::snprintf(line, sizeof(line), "  live tick: score %+.4f  cutoff %+.4f  isolation %.4f  -> %s\n",
                  c.live->score, c.live->cutoff, c.live->raw_score, c.live->is_anomaly ? "ANOMALY" : "normal");
    os << line;
  }
  return os.str();
}

} // namespace ransomwatch::ui
