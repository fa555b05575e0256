#include "app/FeatureAggregator.hpp"

#include <algorithm>
#include <unordered_map>

using ransomwatch::model::FileEventKind;

namespace ransomwatch::app {

double counter_rate(uint64_t prev, uint64_t cur, double elapsed_s, double fallback) {
  if (!(elapsed_s > 0.0)) return fallback;
  if (cur < prev) return 0.0;
  return static_cast<double>(cur - prev) / elapsed_s;
}

FeatureAggregator::FeatureAggregator(Thresholds thresholds, AggregatorOptions opts, ProcessWhitelist whitelist)
  : th_(thresholds), opts_(opts), whitelist_(std::move(whitelist)) {}

AggregatedTick FeatureAggregator::aggregate(TickInput in) {
  using namespace ransomwatch::model;
  AggregatedTick out{};
  SystemMetrics m = in.system;

  double window_s = std::chrono::duration<double>(opts_.nominal_interval).count();
  if (prev_) {
    double elapsed = std::chrono::duration<double>(m.sampled_at - prev_->sampled_at).count();
    if (elapsed > 0.0) window_s = elapsed;
    if (m.has_disk && prev_->has_disk) {
      m.disk_read_bps = counter_rate(prev_->disk_read_bytes, m.disk_read_bytes, elapsed, prev_->disk_read_bps);
      m.disk_write_bps = counter_rate(prev_->disk_write_bytes, m.disk_write_bytes, elapsed, prev_->disk_write_bps);
      m.has_rates = true;
    }
  }
  if (window_s <= 0.0) window_s = 1.0;

  const double disk_ref = th_.disk_reference_bps > 0.0 ? th_.disk_reference_bps : 1.0;
  const double file_ref = th_.file_event_reference > 0.0 ? th_.file_event_reference : 1.0;
  auto file_rate = [&](FileEventKind k) {
    return static_cast<double>(in.files.count(k)) / window_s / file_ref;
  };

  FeatureVector& f = out.features;
  f[kCpuUsage] = m.has_cpu ? m.cpu_pct / 100.0 : 0.0;
  f[kMemoryUsage] = m.has_mem ? m.mem_pct / 100.0 : 0.0;
  f[kDiskReadRate] = m.has_rates ? m.disk_read_bps / disk_ref : 0.0;
  f[kDiskWriteRate] = m.has_rates ? m.disk_write_bps / disk_ref : 0.0;
  f[kFilesCreatedRate] = file_rate(FileEventKind::Created);
  f[kFilesModifiedRate] = file_rate(FileEventKind::Modified);
  f[kFilesDeletedRate] = file_rate(FileEventKind::Deleted);
  f[kFilesRenamedRate] = file_rate(FileEventKind::Renamed);
  double high = 0.0, top_io = 0.0;
  for (const auto& p : in.processes.processes) {
    if (p.cpu_pct > th_.high_process_cpu_pct) high += 1.0;
    if (p.has_io) top_io = std::max(top_io, p.io_bps);
  }
  f[kHighCpuProcesses] = high;
  f[kTopProcessIoRate] = top_io / disk_ref;

  out.suspicious = rank(in.processes, in.files, window_s);
  out.file_counts = in.files.counts;
  out.file_overflow = in.files.overflowed;
  out.file_available = in.files.available;
  out.window_seconds = window_s;
  out.metrics = m;
  prev_ = m;
  return out;
}

std::vector<ransomwatch::model::ProcessInfo> FeatureAggregator::rank(
    const ransomwatch::model::ProcessSnapshot& procs,
    const ransomwatch::model::FileActivityBatch& files,
    double window_s) const {
  using ransomwatch::model::ProcessInfo;
  std::unordered_map<int32_t, uint32_t> writes;
  for (const auto& ev : files.events) {
    if (ev.pid && ev.kind != FileEventKind::Deleted) ++writes[*ev.pid];
  }

  std::vector<ProcessInfo> candidates;
  candidates.reserve(procs.processes.size());
  for (const auto& p : procs.processes) {
    ProcessInfo c = p;
    if (auto it = writes.find(p.pid); it != writes.end()) { c.file_writes = it->second; writes.erase(it); }
    candidates.push_back(std::move(c));
  }
  // writers that exited before the process scan
  for (const auto& [pid, n] : writes) {
    ProcessInfo c{};
    c.pid = pid; c.name = "[exited]"; c.file_writes = n;
    candidates.push_back(std::move(c));
  }

  const double disk_ref = th_.disk_reference_bps > 0.0 ? th_.disk_reference_bps : 1.0;
  const double file_full = std::max(1.0, th_.file_event_reference * window_s);
  std::vector<ProcessInfo> ranked;
  for (auto& c : candidates) {
    if (whitelist_.contains(c.name)) continue;
    double cpu_n = std::clamp(c.cpu_pct / 100.0, 0.0, 1.0);
    double io_n = std::clamp(c.io_bps / disk_ref, 0.0, 1.0);
    double files_n = std::clamp(static_cast<double>(c.file_writes) / file_full, 0.0, 1.0);
    c.suspicion = opts_.weights.cpu * cpu_n + opts_.weights.io * io_n + opts_.weights.files * files_n;
    if (c.suspicion > 0.0) ranked.push_back(std::move(c));
  }
  auto by_suspicion = [](const ProcessInfo& a, const ProcessInfo& b) {
    if (a.suspicion != b.suspicion) return a.suspicion > b.suspicion;
    return a.pid < b.pid;
  };
  if (ranked.size() > opts_.top_n) {
    std::partial_sort(ranked.begin(), ranked.begin() + static_cast<std::ptrdiff_t>(opts_.top_n), ranked.end(), by_suspicion);
    ranked.resize(opts_.top_n);
  } else {
    std::sort(ranked.begin(), ranked.end(), by_suspicion);
  }
  return ranked;
}

} // namespace ransomwatch::app
