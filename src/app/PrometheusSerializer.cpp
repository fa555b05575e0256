#include "app/MetricsServer.hpp"
#include <charconv>
#include <algorithm>
#include <string_view>

namespace {

void append_double(std::string& out, double v) {
  char buf[32];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  if (ec == std::errc{}) {
    out.append(buf, ptr);
  } else {
    out += '0';
  }
}

void append_uint(std::string& out, uint64_t v) {
  char buf[24];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  out.append(buf, ptr);
}

void append_escaped(std::string& out, std::string_view sv, size_t max_len = 0) {
  size_t limit = (max_len > 0) ? std::min(sv.size(), max_len) : sv.size();
  for (size_t i = 0; i < limit; ++i) {
    char c = sv[i];
    if (c == '\\') out += "\\\\";
    else if (c == '"') out += "\\\"";
    else if (c == '\n') out += "\\n";
    else out += c;
  }
}

void emit_header(std::string& out, const char* name, const char* help, const char* type) {
  out += "# HELP ";  out += name;  out += ' ';  out += help;  out += '\n';
  out += "# TYPE ";  out += name;  out += ' ';  out += type;  out += '\n';
}

void emit_gauge_d(std::string& out, const char* name, double value) {
  out += name;  out += ' ';  append_double(out, value);  out += '\n';
}

void emit_gauge_u(std::string& out, const char* name, uint64_t value) {
  out += name;  out += ' ';  append_uint(out, value);  out += '\n';
}

// name{key="val"} value
void emit_labeled_d(std::string& out, const char* name,
                    const char* lk, std::string_view lv, double value) {
  out += name;  out += '{';  out += lk;  out += "=\"";
  append_escaped(out, lv);
  out += "\"} ";  append_double(out, value);  out += '\n';
}

void emit_labeled_u(std::string& out, const char* name,
                    const char* lk, std::string_view lv, uint64_t value) {
  out += name;  out += '{';  out += lk;  out += "=\"";
  append_escaped(out, lv);
  out += "\"} ";  append_uint(out, value);  out += '\n';
}

// name{pid="..",name=".."} value; process names are cut at 32 chars
void emit_process_d(std::string& out, const char* name, int32_t pid,
                    std::string_view comm, double value) {
  char pid_buf[16];
  auto [ptr, ec] = std::to_chars(pid_buf, pid_buf + sizeof(pid_buf), pid);
  out += name;  out += "{pid=\"";  out.append(pid_buf, ptr);
  out += "\",name=\"";  append_escaped(out, comm, 32);  out += "\"} ";
  append_double(out, value);  out += '\n';
}

} // anonymous namespace

namespace ransomwatch::app {

std::string detection_to_prometheus(const ransomwatch::model::DetectionResult& r) {
  using namespace ransomwatch::model;
  std::string out;
  out.reserve(4096);

  // ---- verdict ----
  emit_header(out, "ransomwatch_tick", "Detection tick sequence number", "counter");
  emit_gauge_u(out, "ransomwatch_tick", r.tick);
  emit_header(out, "ransomwatch_anomaly", "1 when the tick was classified anomalous", "gauge");
  emit_gauge_u(out, "ransomwatch_anomaly", r.is_anomaly ? 1 : 0);
  emit_header(out, "ransomwatch_anomaly_score", "Calibrated anomaly score (negative is anomalous)", "gauge");
  emit_gauge_d(out, "ransomwatch_anomaly_score", r.score);
  emit_header(out, "ransomwatch_isolation_score", "Raw isolation forest score in [-1, 0]", "gauge");
  emit_gauge_d(out, "ransomwatch_isolation_score", r.raw_score);
  emit_header(out, "ransomwatch_suppressed", "1 when a flagged tick was below the noise floors", "gauge");
  emit_gauge_u(out, "ransomwatch_suppressed", r.suppressed ? 1 : 0);

  if (!r.factors.empty()) {
    emit_header(out, "ransomwatch_anomaly_factor", "Features outside the learned baseline", "gauge");
    for (const auto& f : r.factors) emit_labeled_u(out, "ransomwatch_anomaly_factor", "feature", f, 1);
  }

  // ---- system ----
  emit_header(out, "ransomwatch_cpu_usage_percent", "Aggregate CPU utilization", "gauge");
  emit_gauge_d(out, "ransomwatch_cpu_usage_percent", r.metrics.cpu_pct);
  emit_header(out, "ransomwatch_memory_usage_percent", "Memory in use", "gauge");
  emit_gauge_d(out, "ransomwatch_memory_usage_percent", r.metrics.mem_pct);
  emit_header(out, "ransomwatch_disk_read_bytes_per_second", "Physical disk read rate", "gauge");
  emit_gauge_d(out, "ransomwatch_disk_read_bytes_per_second", r.metrics.disk_read_bps);
  emit_header(out, "ransomwatch_disk_write_bytes_per_second", "Physical disk write rate", "gauge");
  emit_gauge_d(out, "ransomwatch_disk_write_bytes_per_second", r.metrics.disk_write_bps);

  // ---- files ----
  emit_header(out, "ransomwatch_file_events", "File events observed in the tick window", "gauge");
  for (size_t k = 0; k < kFileEventKinds; ++k)
    emit_labeled_u(out, "ransomwatch_file_events", "kind",
                   file_event_kind_name(static_cast<FileEventKind>(k)), r.file_counts[k]);
  emit_header(out, "ransomwatch_file_events_overflow", "1 when the event queue overflowed", "gauge");
  emit_gauge_u(out, "ransomwatch_file_events_overflow", r.file_overflow ? 1 : 0);
  emit_header(out, "ransomwatch_file_events_available", "0 when no file-event backend is observing", "gauge");
  emit_gauge_u(out, "ransomwatch_file_events_available", r.file_available ? 1 : 0);

  // ---- features ----
  emit_header(out, "ransomwatch_feature", "Normalized feature vector fed to the model", "gauge");
  for (size_t f = 0; f < kFeatureCount; ++f)
    emit_labeled_d(out, "ransomwatch_feature", "name", kFeatureNames[f], r.features[f]);

  // ---- processes ----
  if (!r.suspicious.empty()) {
    emit_header(out, "ransomwatch_process_suspicion", "Composite suspicion score of ranked processes", "gauge");
    for (const auto& p : r.suspicious)
      emit_process_d(out, "ransomwatch_process_suspicion", p.pid, p.name, p.suspicion);
    emit_header(out, "ransomwatch_process_cpu_percent", "CPU usage of ranked processes", "gauge");
    for (const auto& p : r.suspicious)
      emit_process_d(out, "ransomwatch_process_cpu_percent", p.pid, p.name, p.cpu_pct);
    emit_header(out, "ransomwatch_process_io_bytes_per_second", "I/O rate of ranked processes", "gauge");
    for (const auto& p : r.suspicious)
      emit_process_d(out, "ransomwatch_process_io_bytes_per_second", p.pid, p.name, p.io_bps);
    emit_header(out, "ransomwatch_process_file_writes", "Attributed file writes of ranked processes", "gauge");
    for (const auto& p : r.suspicious)
      emit_process_d(out, "ransomwatch_process_file_writes", p.pid, p.name, static_cast<double>(p.file_writes));
  }

  return out;
}

} // namespace ransomwatch::app
