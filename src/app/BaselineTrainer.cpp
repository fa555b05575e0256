#include "app/BaselineTrainer.hpp"
#include "app/Errors.hpp"
#include "util/Log.hpp"

#include <algorithm>
#include <cmath>

using ransomwatch::model::FeatureVector;
using ransomwatch::model::kFeatureCount;

namespace ransomwatch::app {

BaselineTrainer::BaselineTrainer(TrainerOptions opts) : opts_(opts) {}

double BaselineTrainer::percentile(std::vector<double> values, double pct) {
  if (values.empty()) return 0.0;
  std::sort(values.begin(), values.end());
  double pos = std::clamp(pct, 0.0, 100.0) / 100.0 * static_cast<double>(values.size() - 1);
  size_t lo = static_cast<size_t>(std::floor(pos));
  size_t hi = std::min(lo + 1, values.size() - 1);
  double frac = pos - static_cast<double>(lo);
  return values[lo] + (values[hi] - values[lo]) * frac;
}

TrainedModel BaselineTrainer::train(std::chrono::milliseconds duration, std::chrono::milliseconds interval,
                                    IClock& clock, const SampleFn& next_sample, const std::stop_token& st,
                                    std::vector<FeatureVector>* baseline) const {
  std::vector<FeatureVector> rows;
  const auto start = clock.now();
  const auto deadline = start + duration;
  size_t failed = 0;
  for (int64_t k = 0;; ++k) {
    auto tick_at = start + interval * k;
    if (tick_at >= deadline) break;
    if (st.stop_requested()) throw TrainingCancelledError(rows.size());
    clock.sleep_until(tick_at, st);
    if (st.stop_requested()) throw TrainingCancelledError(rows.size());
    if (auto row = next_sample()) rows.push_back(*row);
    else ++failed;
    if (rows.size() % 60 == 0 && !rows.empty())
      RW_LOG_INFO("BaselineTrainer", "collected %zu baseline samples", rows.size());
  }
  if (failed > 0) RW_LOG_WARN("BaselineTrainer", "%zu training ticks failed and were skipped", failed);
  if (baseline) *baseline = rows;
  return fit(rows, interval);
}

TrainedModel BaselineTrainer::fit(const std::vector<FeatureVector>& rows, std::chrono::milliseconds interval) const {
  const size_t required = std::max<size_t>(2, opts_.min_samples);
  if (rows.size() < required) throw InsufficientDataError(rows.size(), required);

  TrainedModel m{};
  m.interval = interval;
  m.contamination = opts_.contamination;
  m.samples = rows.size();

  for (size_t f = 0; f < kFeatureCount; ++f) {
    FeatureStats s{rows[0][f], rows[0][f], 0.0, 0.0};
    for (const auto& r : rows) { s.min = std::min(s.min, r[f]); s.max = std::max(s.max, r[f]); s.mean += r[f]; }
    s.mean /= static_cast<double>(rows.size());
    for (const auto& r : rows) s.std += (r[f] - s.mean) * (r[f] - s.mean);
    s.std = std::sqrt(s.std / static_cast<double>(rows.size()));
    m.stats[f] = s;
  }

  m.scaler.fit(rows);
  std::vector<FeatureVector> scaled;
  scaled.reserve(rows.size());
  for (const auto& r : rows) scaled.push_back(m.scaler.transform(r));
  m.forest.fit(scaled, opts_.forest);

  std::vector<double> scores;
  scores.reserve(scaled.size());
  for (const auto& r : scaled) scores.push_back(m.forest.score_samples(r));
  m.offset = percentile(scores, 100.0 * opts_.contamination);
  double sum = 0.0, sq = 0.0;
  for (double s : scores) { sum += s; sq += s * s; }
  m.train_score_mean = sum / static_cast<double>(scores.size());
  m.train_score_std = std::sqrt(std::max(0.0, sq / static_cast<double>(scores.size()) - m.train_score_mean * m.train_score_mean));

  RW_LOG_INFO("BaselineTrainer", "model fitted on %zu samples (%d trees, subsample %d, offset %.4f)",
              m.samples, static_cast<int>(m.forest.trees().size()), m.forest.subsample(), m.offset);
  return m;
}

} // namespace ransomwatch::app
