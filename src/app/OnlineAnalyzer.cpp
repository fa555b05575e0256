#include "app/OnlineAnalyzer.hpp"
#include "app/Errors.hpp"

#include <algorithm>
#include <cmath>

using namespace ransomwatch::model;

namespace ransomwatch::app {

OnlineAnalyzer::OnlineAnalyzer(Thresholds thresholds) : th_(thresholds) {}

double OnlineAnalyzer::noise_floor(size_t f) const {
  const double disk_ref = th_.disk_reference_bps > 0.0 ? th_.disk_reference_bps : 1.0;
  const double file_ref = th_.file_event_reference > 0.0 ? th_.file_event_reference : 1.0;
  switch (f) {
    case kCpuUsage: return th_.cpu_noise_floor_pct / 100.0;
    case kMemoryUsage: return 0.05;
    case kDiskReadRate:
    case kDiskWriteRate:
    case kTopProcessIoRate: return th_.disk_noise_floor_bps / disk_ref;
    case kFilesCreatedRate:
    case kFilesModifiedRate:
    case kFilesDeletedRate:
    case kFilesRenamedRate: return th_.file_noise_floor_per_s / file_ref;
    case kHighCpuProcesses: return 1.0;
    default: break;
  }
  return 0.0;
}

Verdict OnlineAnalyzer::score(const FeatureVector& x) const {
  std::shared_ptr<const TrainedModel> model = model_;
  if (!model) throw ModelNotTrainedError();

  Verdict v{};
  v.raw_score = model->forest.score_samples(model->scaler.transform(x));
  const double decision = v.raw_score - model->offset;

  for (size_t f = 0; f < kFeatureCount; ++f) {
    const auto& s = model->stats[f];
    const double width = std::max(s.max - s.min, noise_floor(f));
    double excess = 0.0;
    if (width > 0.0) {
      const double upper = s.max + th_.range_tolerance * width;
      excess = std::max(0.0, (x[f] - upper) / width);
    }
    v.range_excess += excess;
    const double z = (x[f] - s.mean) / std::max(s.std, 1e-9);
    if (excess > 0.0 || (s.std > 0.0 && z > 3.0)) v.factors.emplace_back(kFeatureNames[f]);
  }
  v.score = decision - v.range_excess;

  v.cutoff = -(th_.score_margin + th_.score_std_margin * model->train_score_std);
  bool flagged = v.score < v.cutoff;
  if (flagged) {
    bool all_quiet = std::all_of(kActivityFeatures.begin(), kActivityFeatures.end(),
                                 [&](size_t f) { return x[f] < noise_floor(f); });
    if (all_quiet) { flagged = false; v.suppressed = true; }
  }
  v.is_anomaly = flagged;
  return v;
}

} // namespace ransomwatch::app
