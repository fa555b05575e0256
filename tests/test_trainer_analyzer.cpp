#include "minitest.hpp"
#include "fakes.hpp"
#include "app/BaselineTrainer.hpp"
#include "app/Errors.hpp"
#include "app/OnlineAnalyzer.hpp"

#include <algorithm>
#include <random>

using namespace ransomwatch::app;
using namespace ransomwatch::model;
using namespace std::chrono_literals;

static Thresholds host4() {
  HostProfile h{}; h.cpu_count = 4; h.disk_class = DiskClass::Unknown;
  return derive_thresholds(h, ThresholdOptions{});
}

// A busy workstation: steady CPU, disk writes and file churn well above
// the noise floors.
static std::vector<FeatureVector> busy_rows(size_t n, uint64_t seed) {
  std::mt19937_64 rng(seed);
  auto u = [&](double lo, double hi) { return std::uniform_real_distribution<double>(lo, hi)(rng); };
  std::vector<FeatureVector> rows(n);
  for (auto& r : rows) {
    r[kCpuUsage] = u(0.20, 0.60);
    r[kMemoryUsage] = u(0.45, 0.55);
    r[kDiskReadRate] = u(0.01, 0.10);
    r[kDiskWriteRate] = u(0.05, 0.25);
    r[kFilesCreatedRate] = u(0.01, 0.05);
    r[kFilesModifiedRate] = u(0.05, 0.20);
    r[kFilesDeletedRate] = u(0.0, 0.02);
    r[kFilesRenamedRate] = u(0.0, 0.02);
    r[kHighCpuProcesses] = 0.0;
    r[kTopProcessIoRate] = u(0.02, 0.10);
  }
  return rows;
}

static TrainerOptions small_forest(double contamination) {
  TrainerOptions o{};
  o.contamination = contamination;
  o.min_samples = 10;
  o.forest = ForestParams{.trees = 100, .max_samples = 256, .seed = 42};
  return o;
}

TEST(percentile_interpolates) {
  ASSERT_NEAR(BaselineTrainer::percentile({4, 1, 3, 2}, 50.0), 2.5, 1e-12);
  ASSERT_NEAR(BaselineTrainer::percentile({4, 1, 3, 2}, 0.0), 1.0, 1e-12);
  ASSERT_NEAR(BaselineTrainer::percentile({4, 1, 3, 2}, 100.0), 4.0, 1e-12);
  ASSERT_NEAR(BaselineTrainer::percentile({}, 50.0), 0.0, 1e-12);
}

TEST(fit_rejects_too_few_samples) {
  BaselineTrainer t(small_forest(0.1));
  auto rows = busy_rows(5, 1);
  bool thrown = false;
  try {
    (void)t.fit(rows, 1000ms);
  } catch (const InsufficientDataError& e) {
    thrown = true;
    ASSERT_EQ(e.collected(), 5u);
    ASSERT_EQ(e.required(), 10u);
  }
  ASSERT_TRUE(thrown);
}

TEST(fit_records_model_metadata) {
  BaselineTrainer t(small_forest(0.1));
  auto rows = busy_rows(50, 2);
  auto m = t.fit(rows, 2000ms);
  ASSERT_EQ(m.samples, 50u);
  ASSERT_TRUE(m.interval == 2000ms);
  ASSERT_NEAR(m.contamination, 0.1, 1e-12);
  ASSERT_EQ(m.schema_version, kFeatureSchemaVersion);
  ASSERT_TRUE(!m.forest.empty());
  ASSERT_TRUE(m.offset < 0.0 && m.offset > -1.0);
  for (size_t f = 0; f < kFeatureCount; ++f) {
    ASSERT_TRUE(m.stats[f].min <= m.stats[f].mean && m.stats[f].mean <= m.stats[f].max);
    ASSERT_TRUE(m.stats[f].std >= 0.0);
  }
  // roughly `contamination` of the training scores fall under the offset
  size_t below = 0;
  for (const auto& r : rows) if (m.forest.score_samples(m.scaler.transform(r)) < m.offset) ++below;
  ASSERT_TRUE(below <= 6);
}

TEST(train_samples_once_per_interval) {
  fakes::FakeClock clock;
  BaselineTrainer t(small_forest(0.1));
  auto rows = busy_rows(20, 3);
  size_t next = 0;
  std::vector<IClock::time_point> at;
  auto start = clock.now();
  std::vector<FeatureVector> baseline;
  auto m = t.train(10s, 1s, clock, [&]() -> std::optional<FeatureVector> {
    at.push_back(clock.now());
    return rows[next++];
  }, std::stop_token{}, &baseline);
  ASSERT_EQ(at.size(), 10u);
  ASSERT_EQ(baseline.size(), 10u);
  ASSERT_EQ(m.samples, 10u);
  for (size_t k = 0; k < at.size(); ++k) ASSERT_TRUE(at[k] == start + std::chrono::seconds(k));
}

TEST(train_skips_failed_ticks) {
  fakes::FakeClock clock;
  BaselineTrainer t(small_forest(0.1));
  auto rows = busy_rows(20, 4);
  int call = 0;
  ASSERT_THROWS((void)t.train(10s, 1s, clock, [&]() -> std::optional<FeatureVector> {
    if (call++ % 2) return std::nullopt;
    return rows[static_cast<size_t>(call)];
  }, std::stop_token{}), InsufficientDataError);
}

TEST(train_stops_early_on_request) {
  fakes::FakeClock clock;
  BaselineTrainer t(small_forest(0.1));
  auto rows = busy_rows(200, 5);
  std::stop_source ss;
  size_t n = 0;
  ASSERT_THROWS((void)t.train(100s, 1s, clock, [&]() -> std::optional<FeatureVector> {
    if (n == 3) ss.request_stop();
    return rows[n++];
  }, ss.get_token()), TrainingCancelledError);
  ASSERT_EQ(n, 4u);
}

TEST(train_cancelled_with_enough_rows_still_fits_nothing) {
  fakes::FakeClock clock;
  BaselineTrainer t(small_forest(0.1));
  auto rows = busy_rows(200, 5);
  std::stop_source ss;
  size_t n = 0;
  std::vector<FeatureVector> kept{rows[0]};
  size_t collected = 0;
  try {
    (void)t.train(100s, 1s, clock, [&]() -> std::optional<FeatureVector> {
      if (n == 29) ss.request_stop();
      return rows[n++];
    }, ss.get_token(), &kept);
  } catch (const TrainingCancelledError& e) {
    collected = e.collected();
  }
  ASSERT_EQ(collected, 30u);
  ASSERT_EQ(kept.size(), 1u);
}

TEST(analyzer_requires_model) {
  OnlineAnalyzer a(host4());
  ASSERT_TRUE(!a.has_model());
  FeatureVector x{};
  ASSERT_THROWS((void)a.score(x), ModelNotTrainedError);
}

TEST(analyzer_accepts_held_out_baseline_samples) {
  auto rows = busy_rows(800, 6);
  std::vector<FeatureVector> train(rows.begin(), rows.begin() + 600);
  std::vector<FeatureVector> held(rows.begin() + 600, rows.end());
  // shipped defaults: contamination 0.1, no fixed margin
  BaselineTrainer t(TrainerOptions{});
  OnlineAnalyzer a(host4());
  auto model = std::make_shared<const TrainedModel>(t.fit(train, 1000ms));
  a.set_model(model);
  int normal = 0, below_offset = 0;
  for (const auto& x : held) {
    auto v = a.score(x);
    if (!v.is_anomaly) ++normal;
    if (v.score < 0.0) ++below_offset;
    ASSERT_NEAR(v.cutoff, -2.0 * model->train_score_std, 1e-12);
  }
  ASSERT_TRUE(normal >= 190);
  // the offset alone sits at the contamination quantile
  ASSERT_TRUE(below_offset > 200 - normal);
}

TEST(analyzer_flags_hundredfold_write_rate) {
  auto rows = busy_rows(300, 7);
  BaselineTrainer t(small_forest(0.05));
  OnlineAnalyzer a(host4());
  auto model = std::make_shared<const TrainedModel>(t.fit(rows, 1000ms));
  a.set_model(model);
  double max_write = 0.0;
  for (const auto& r : rows) max_write = std::max(max_write, r[kDiskWriteRate]);
  ASSERT_NEAR(max_write, model->stats[kDiskWriteRate].max, 1e-12);

  FeatureVector x = rows[0];
  x[kDiskWriteRate] = 100.0 * max_write;
  auto v = a.score(x);
  ASSERT_TRUE(v.is_anomaly);
  ASSERT_TRUE(!v.suppressed);
  ASSERT_TRUE(v.score < -1.0);
  ASSERT_TRUE(v.range_excess > 0.0);
  ASSERT_TRUE(std::find(v.factors.begin(), v.factors.end(), std::string("disk_write_rate")) != v.factors.end());
}

TEST(analyzer_suppresses_flags_below_noise_floor) {
  // idle baseline: CPU 2-5 %, no disk or file activity
  std::mt19937_64 rng(8);
  std::vector<FeatureVector> rows(100);
  for (auto& r : rows) {
    r.fill(0.0);
    r[kCpuUsage] = std::uniform_real_distribution<double>(0.02, 0.05)(rng);
    r[kMemoryUsage] = 0.40;
  }
  BaselineTrainer t(small_forest(0.1));
  OnlineAnalyzer a(host4());
  a.set_model(std::make_shared<const TrainedModel>(t.fit(rows, 1000ms)));

  // memory jumped but nothing is active: statistically odd, not an attack
  FeatureVector x = rows[0];
  x[kMemoryUsage] = 0.90;
  auto v = a.score(x);
  ASSERT_TRUE(v.score < 0.0);
  ASSERT_TRUE(v.suppressed);
  ASSERT_TRUE(!v.is_anomaly);

  // same memory jump with real write activity
  x[kDiskWriteRate] = 0.5;
  auto w = a.score(x);
  ASSERT_TRUE(w.is_anomaly);
  ASSERT_TRUE(!w.suppressed);
}

TEST(analyzer_noise_floors_in_feature_units) {
  OnlineAnalyzer a(host4());
  ASSERT_NEAR(a.noise_floor(kCpuUsage), 0.10, 1e-12);
  ASSERT_NEAR(a.noise_floor(kDiskWriteRate), 1.0 / 200.0, 1e-12);
  ASSERT_NEAR(a.noise_floor(kFilesRenamedRate), 0.02, 1e-12);
  ASSERT_NEAR(a.noise_floor(kHighCpuProcesses), 1.0, 1e-12);
}
