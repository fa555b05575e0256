#include "minitest.hpp"
#include "fakes.hpp"
#include "app/Detector.hpp"
#include "app/Errors.hpp"

#include <algorithm>

using namespace ransomwatch::app;
using namespace ransomwatch::model;
using namespace std::chrono_literals;

namespace {

struct Rig {
  fakes::FakeClock clock;
  fakes::FakeSystemCollector sys{clock};
  fakes::FakeProcessCollector procs;
  fakes::FakeFileCollector files;
  fakes::MemoryStorage storage;

  DetectorDeps deps(bool with_storage = true) {
    return DetectorDeps{sys, procs, files, clock, with_storage ? &storage : nullptr};
  }
};

Thresholds host4() {
  HostProfile h{}; h.cpu_count = 4; h.disk_class = DiskClass::Unknown;
  return derive_thresholds(h, ThresholdOptions{});
}

DetectorOptions fast_options() {
  DetectorOptions o{};
  o.interval = 1000ms;
  o.contamination = 0.05;
  o.min_training_samples = 10;
  o.forest = ForestParams{.trees = 50, .max_samples = 64, .seed = 42};
  o.parallel_collect = false;
  return o;
}

} // namespace

TEST(detector_starts_idle_without_model) {
  Rig rig;
  Detector d(fast_options(), host4(), rig.deps());
  ASSERT_TRUE(d.state() == DetectorState::Idle);
  ASSERT_TRUE(d.model() == nullptr);
  ASSERT_THROWS((void)d.detect(), ModelNotTrainedError);
  ASSERT_TRUE(d.state() == DetectorState::Idle);
}

TEST(detector_options_are_validated) {
  Rig rig;
  auto bad_interval = fast_options(); bad_interval.interval = 0ms;
  ASSERT_THROWS(Detector rejected(bad_interval, host4(), rig.deps()), std::invalid_argument);
  auto bad_contamination = fast_options(); bad_contamination.contamination = 0.6;
  ASSERT_THROWS(bad_contamination.validate(), std::invalid_argument);
  auto bad_top = fast_options(); bad_top.top_n = 0;
  ASSERT_THROWS(bad_top.validate(), std::invalid_argument);
  auto bad_failures = fast_options(); bad_failures.max_consecutive_failures = 0;
  ASSERT_THROWS(bad_failures.validate(), std::invalid_argument);
  fast_options().validate();
}

TEST(detector_rejects_non_positive_training_duration) {
  Rig rig;
  Detector d(fast_options(), host4(), rig.deps());
  ASSERT_THROWS(d.train(0ms), std::invalid_argument);
  ASSERT_TRUE(d.state() == DetectorState::Idle);
}

TEST(detector_idle_host_then_write_burst) {
  Rig rig;
  Detector d(fast_options(), host4(), rig.deps());
  d.train(60s);
  ASSERT_TRUE(d.state() == DetectorState::Ready);
  auto m = d.model();
  ASSERT_TRUE(m != nullptr);
  ASSERT_EQ(m->samples, 60u);
  ASSERT_TRUE(m->interval == 1000ms);
  ASSERT_EQ(m->trained_at_ms, rig.clock.wall_ms());
  ASSERT_EQ(rig.storage.saves, 1);
  ASSERT_EQ(rig.storage.baseline_rows, 60u);
  ASSERT_EQ(d.last_baseline().size(), 60u);

  rig.clock.advance(1s);
  auto quiet = d.detect();
  ASSERT_TRUE(d.state() == DetectorState::Detecting);
  ASSERT_EQ(quiet.tick, 1u);
  ASSERT_TRUE(!quiet.is_anomaly);

  rig.clock.advance(1s);
  rig.sys.set_write(200 * kMiB, 200 * kMiB);
  rig.sys.set_cpu(90.0, 90.0);
  rig.procs.processes = {fakes::proc(4242, "encryptor", 95.0, 200 * kMiB), fakes::proc(1, "init", 0.1)};
  auto burst = d.detect();
  ASSERT_EQ(burst.tick, 2u);
  ASSERT_TRUE(burst.is_anomaly);
  ASSERT_TRUE(!burst.suppressed);
  ASSERT_TRUE(burst.score < -10.0);
  ASSERT_NEAR(burst.metrics.disk_write_bps, 200 * kMiB, 1.0);
  ASSERT_TRUE(!burst.suspicious.empty());
  ASSERT_EQ(burst.suspicious[0].pid, 4242);
  ASSERT_TRUE(std::find(burst.factors.begin(), burst.factors.end(), std::string("disk_write_rate")) != burst.factors.end());
  ASSERT_EQ(burst.timestamp_ms, rig.clock.wall_ms());
  ASSERT_EQ(rig.storage.appended.size(), 2u);
  ASSERT_EQ(rig.storage.appended[1], 2u);
}

TEST(detector_run_keeps_interval_cadence) {
  Rig rig;
  Detector d(fast_options(), host4(), rig.deps());
  d.train(20s);
  rig.sys.collect_cost = 100ms;
  const size_t before = rig.sys.sample_times.size();
  uint64_t seen = 0;
  auto n = d.run(std::stop_token{}, [&](const DetectionResult& r) { seen = r.tick; }, 5);
  ASSERT_EQ(n, 5u);
  ASSERT_EQ(seen, 5u);
  ASSERT_TRUE(d.state() == DetectorState::Detecting);
  const auto& t = rig.sys.sample_times;
  ASSERT_EQ(t.size(), before + 5);
  // training's last sample included: every tick starts one interval after the previous
  for (size_t i = before; i < t.size(); ++i) ASSERT_TRUE(t[i] - t[i - 1] == 1000ms);
}

TEST(detector_slow_collection_never_overlaps) {
  Rig rig;
  Detector d(fast_options(), host4(), rig.deps());
  d.train(20s);
  rig.sys.collect_cost = 1500ms;
  const size_t before = rig.sys.sample_times.size();
  (void)d.run(std::stop_token{}, nullptr, 4);
  const auto& t = rig.sys.sample_times;
  for (size_t i = before + 1; i < t.size(); ++i) ASSERT_TRUE(t[i] - t[i - 1] >= 1500ms);
}

TEST(detector_retries_transient_tick_failure) {
  Rig rig;
  Detector d(fast_options(), host4(), rig.deps());
  d.train(20s);
  rig.clock.advance(1s);
  rig.sys.fail_next = 2;
  const auto start = rig.clock.now();
  auto r = d.detect();
  ASSERT_EQ(r.tick, 1u);
  ASSERT_TRUE(d.state() == DetectorState::Detecting);
  ASSERT_TRUE(rig.clock.now() - start == 2 * fast_options().retry_backoff);
  ASSERT_EQ(rig.storage.appended.size(), 1u);
}

TEST(detector_stops_after_consecutive_failures) {
  Rig rig;
  auto opts = fast_options();
  opts.max_consecutive_failures = 3;
  Detector d(opts, host4(), rig.deps());
  d.train(20s);
  rig.sys.fail_always = true;
  bool thrown = false;
  try {
    (void)d.detect();
  } catch (const ConsecutiveTickFailure& e) {
    thrown = true;
    ASSERT_EQ(e.attempts(), 3);
  }
  ASSERT_TRUE(thrown);
  ASSERT_TRUE(d.state() == DetectorState::Stopped);
  ASSERT_TRUE(rig.storage.appended.empty());
  ASSERT_THROWS((void)d.detect(), DetectorStoppedError);
  ASSERT_THROWS(d.train(10s), DetectorStoppedError);
}

TEST(detector_training_skips_failed_samples) {
  Rig rig;
  Detector d(fast_options(), host4(), rig.deps());
  rig.sys.fail_next = 3;   // priming sample and two training ticks
  d.train(20s);
  ASSERT_EQ(d.model()->samples, 18u);
  ASSERT_TRUE(d.state() == DetectorState::Ready);
}

TEST(detector_insufficient_training_returns_to_idle) {
  Rig rig;
  Detector d(fast_options(), host4(), rig.deps());
  ASSERT_THROWS(d.train(5s), InsufficientDataError);
  ASSERT_TRUE(d.state() == DetectorState::Idle);
  ASSERT_TRUE(d.model() == nullptr);
  ASSERT_EQ(rig.storage.saves, 0);
}

TEST(detector_failed_retrain_discards_previous_model) {
  Rig rig;
  Detector d(fast_options(), host4(), rig.deps());
  d.train(20s);
  rig.clock.advance(1s);
  (void)d.detect();
  ASSERT_THROWS(d.train(3s), InsufficientDataError);
  ASSERT_TRUE(d.state() == DetectorState::Idle);
  ASSERT_TRUE(d.model() == nullptr);
  ASSERT_THROWS((void)d.detect(), ModelNotTrainedError);
}

TEST(detector_retrain_from_detecting_publishes_new_model) {
  Rig rig;
  Detector d(fast_options(), host4(), rig.deps());
  d.train(20s);
  auto first = d.model();
  rig.clock.advance(1s);
  (void)d.detect();
  d.train(15s);
  auto second = d.model();
  ASSERT_TRUE(d.state() == DetectorState::Ready);
  ASSERT_TRUE(second != nullptr && second != first);
  ASSERT_EQ(second->samples, 15u);
  ASSERT_EQ(first->samples, 20u);
  ASSERT_EQ(rig.storage.saves, 2);
}

TEST(detector_initialize_from_storage) {
  Rig rig;
  {
    Detector trainer(fast_options(), host4(), rig.deps());
    trainer.train(20s);
  }
  Detector d(fast_options(), host4(), rig.deps());
  ASSERT_TRUE(d.initialize());
  ASSERT_TRUE(d.state() == DetectorState::Ready);
  ASSERT_EQ(rig.storage.loads, 1);
  ASSERT_EQ(d.model()->samples, 20u);
  // already initialized
  ASSERT_TRUE(!d.initialize());
  auto r = d.detect();
  ASSERT_EQ(r.tick, 1u);
  ASSERT_TRUE(r.metrics.has_rates);
}

TEST(detector_initialize_without_usable_model) {
  Rig rig;
  Detector no_storage(fast_options(), host4(), rig.deps(false));
  ASSERT_TRUE(!no_storage.initialize());
  ASSERT_TRUE(no_storage.state() == DetectorState::Idle);

  Detector empty(fast_options(), host4(), rig.deps());
  ASSERT_TRUE(!empty.initialize());

  {
    auto opts = fast_options(); opts.interval = 5000ms;
    Detector other_interval(opts, host4(), rig.deps());
    other_interval.train(60s);
  }
  Detector d(fast_options(), host4(), rig.deps());
  ASSERT_TRUE(!d.initialize());
  ASSERT_TRUE(d.state() == DetectorState::Idle);
  ASSERT_TRUE(d.model() == nullptr);
}

TEST(detector_stop_is_terminal) {
  Rig rig;
  Detector d(fast_options(), host4(), rig.deps());
  d.train(20s);
  d.stop();
  ASSERT_TRUE(d.state() == DetectorState::Stopped);
  ASSERT_THROWS((void)d.detect(), DetectorStoppedError);
  ASSERT_THROWS((void)d.run(std::stop_token{}, nullptr), DetectorStoppedError);
  ASSERT_THROWS((void)d.initialize(), DetectorStoppedError);
}

TEST(detector_run_cancelled_by_token) {
  Rig rig;
  Detector d(fast_options(), host4(), rig.deps());
  d.train(20s);
  std::stop_source ss;
  int delivered = 0;
  auto n = d.run(ss.get_token(), [&](const DetectionResult&) {
    if (++delivered == 3) ss.request_stop();
  });
  ASSERT_EQ(n, 3u);
  ASSERT_EQ(d.ticks(), 3u);
  ASSERT_TRUE(d.state() == DetectorState::Stopped);
}

TEST(detector_training_interrupted_by_stop) {
  Rig rig;
  Detector d(fast_options(), host4(), rig.deps());
  std::stop_source ss;
  ss.request_stop();
  bool threw = false;
  try {
    d.train(60s, ss.get_token());
  } catch (const DetectorError&) {
    threw = true;
  }
  ASSERT_TRUE(threw);
  ASSERT_TRUE(d.model() == nullptr);
  ASSERT_EQ(rig.storage.saves, 0);
}

TEST(detector_training_cancelled_mid_window_publishes_nothing) {
  Rig rig;
  Detector d(fast_options(), host4(), rig.deps());
  std::stop_source ss;
  // priming plus 21 baseline rows, well past min_training_samples
  rig.procs.on_sample = [&](int n) { if (n == 22) ss.request_stop(); };
  ASSERT_THROWS(d.train(300s, ss.get_token()), TrainingCancelledError);
  ASSERT_TRUE(d.model() == nullptr);
  ASSERT_TRUE(d.state() == DetectorState::Idle);
  ASSERT_EQ(rig.storage.saves, 0);
  ASSERT_EQ(rig.storage.baseline_rows, 0u);
  ASSERT_THROWS((void)d.detect(), ModelNotTrainedError);

  rig.procs.on_sample = nullptr;
  d.train(15s);
  ASSERT_TRUE(d.state() == DetectorState::Ready);
  ASSERT_EQ(rig.storage.saves, 1);
}

TEST(detector_parallel_collection) {
  Rig rig;
  auto opts = fast_options();
  opts.parallel_collect = true;
  Detector d(opts, host4(), rig.deps());
  rig.procs.processes = {fakes::proc(7, "worker", 20.0, 1024.0)};
  d.train(15s);
  rig.clock.advance(1s);
  auto r = d.detect();
  ASSERT_EQ(r.suspicious.size(), 1u);
  ASSERT_EQ(r.suspicious[0].pid, 7);
}
