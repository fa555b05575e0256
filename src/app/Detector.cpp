#include "app/Detector.hpp"
#include "app/Errors.hpp"
#include "util/Log.hpp"

#include <algorithm>
#include <future>
#include <stdexcept>

using namespace std::chrono;
using ransomwatch::model::DetectionResult;
using ransomwatch::model::FeatureVector;

namespace ransomwatch::app {

namespace {

// Stop source that fires when either input token does.
struct LinkedStop {
  std::stop_source src;
  std::stop_callback<std::function<void()>> a;
  std::stop_callback<std::function<void()>> b;
  LinkedStop(const std::stop_token& x, const std::stop_token& y)
    : a(x, std::function<void()>([this]{ src.request_stop(); })),
      b(y, std::function<void()>([this]{ src.request_stop(); })) {}
  std::stop_token token() const { return src.get_token(); }
};

} // namespace

const char* state_name(DetectorState s) {
  switch (s) {
    case DetectorState::Idle:      return "idle";
    case DetectorState::Training:  return "training";
    case DetectorState::Ready:     return "ready";
    case DetectorState::Detecting: return "detecting";
    case DetectorState::Stopped:   return "stopped";
  }
  return "unknown";
}

void DetectorOptions::validate() const {
  if (interval <= milliseconds::zero()) throw std::invalid_argument("interval must be positive");
  if (!(contamination > 0.0 && contamination < 0.5))
    throw std::invalid_argument("contamination must be in (0, 0.5)");
  if (top_n == 0) throw std::invalid_argument("top_n must be at least 1");
  if (max_consecutive_failures < 1) throw std::invalid_argument("max_consecutive_failures must be at least 1");
  if (retry_backoff < milliseconds::zero()) throw std::invalid_argument("retry_backoff must not be negative");
  if (forest.trees < 1 || forest.max_samples < 2) throw std::invalid_argument("forest needs trees >= 1 and max_samples >= 2");
}

Detector::Detector(DetectorOptions opts, Thresholds thresholds, DetectorDeps deps, ProcessWhitelist whitelist)
  : opts_((opts.validate(), opts)),
    th_(thresholds),
    deps_(deps),
    aggregator_(thresholds,
                AggregatorOptions{.nominal_interval = opts.interval, .top_n = opts.top_n, .weights = opts.weights},
                std::move(whitelist)),
    analyzer_(thresholds) {}

void Detector::set_state(DetectorState s) {
  DetectorState prev = state_.exchange(s, std::memory_order_acq_rel);
  if (prev != s) RW_LOG_INFO("Detector", "%s -> %s", state_name(prev), state_name(s));
}

std::shared_ptr<const TrainedModel> Detector::model() const {
  std::lock_guard<std::mutex> lk(model_mu_);
  return model_;
}

void Detector::publish_model(std::shared_ptr<const TrainedModel> m) {
  {
    std::lock_guard<std::mutex> lk(model_mu_);
    model_ = m;
  }
  analyzer_.set_model(std::move(m));
}

bool Detector::initialize() {
  DetectorState s = state();
  if (s == DetectorState::Stopped) throw DetectorStoppedError();
  if (s != DetectorState::Idle) {
    RW_LOG_DEBUG("Detector", "initialize() ignored in state %s", state_name(s));
    return false;
  }
  if (!deps_.storage) return false;
  auto loaded = deps_.storage->load();
  if (!loaded) return false;
  if (loaded->interval != opts_.interval) {
    RW_LOG_WARN("Detector", "saved model was trained at a %lld ms interval, running at %lld ms; ignoring it",
                static_cast<long long>(loaded->interval.count()), static_cast<long long>(opts_.interval.count()));
    return false;
  }
  publish_model(std::make_shared<const TrainedModel>(std::move(*loaded)));
  set_state(DetectorState::Ready);
  return true;
}

TickInput Detector::collect() {
  TickInput in{};
  if (opts_.parallel_collect) {
    auto procs = std::async(std::launch::async, [this]{ return deps_.processes.sample(); });
    auto files = std::async(std::launch::async, [this]{ return deps_.files.sample(); });
    in.system = deps_.system.sample();
    in.processes = procs.get();
    in.files = files.get();
  } else {
    in.system = deps_.system.sample();
    in.processes = deps_.processes.sample();
    in.files = deps_.files.sample();
  }
  return in;
}

AggregatedTick Detector::collect_and_aggregate() {
  const auto started = deps_.clock.now();
  const int64_t wall = deps_.clock.wall_ms();
  TickInput in = collect();
  in.system.sampled_at = started;
  in.system.timestamp_ms = wall;
  last_sample_at_ = started;
  return aggregator_.aggregate(std::move(in));
}

void Detector::prime(const std::stop_token& st) {
  (void)collect_and_aggregate();
  auto wait = std::min<milliseconds>(opts_.interval, milliseconds(1000));
  deps_.clock.sleep_until(deps_.clock.now() + wait, st);
}

void Detector::train(milliseconds duration, std::stop_token st) {
  if (duration <= milliseconds::zero()) throw std::invalid_argument("training duration must be positive");
  DetectorState s = state();
  if (s == DetectorState::Stopped) throw DetectorStoppedError();
  if (s == DetectorState::Training) throw DetectorError("training already in progress");
  set_state(DetectorState::Training);

  LinkedStop linked(st, stop_.get_token());
  const auto token = linked.token();
  BaselineTrainer trainer(TrainerOptions{
    .contamination = opts_.contamination,
    .min_samples = opts_.min_training_samples,
    .forest = opts_.forest,
  });

  auto next_sample = [&]() -> std::optional<FeatureVector> {
    try {
      return collect_and_aggregate().features;
    } catch (const std::exception& e) {
      RW_LOG_WARN("Detector", "training tick failed: %s", e.what());
      return std::nullopt;
    }
  };

  RW_LOG_INFO("Detector", "training for %lld s at a %lld ms interval",
              static_cast<long long>(duration_cast<seconds>(duration).count()),
              static_cast<long long>(opts_.interval.count()));
  std::vector<FeatureVector> rows;
  try {
    aggregator_.reset();
    try {
      prime(token);
    } catch (const std::exception& e) {
      RW_LOG_WARN("Detector", "priming sample failed: %s", e.what());
    }
    TrainedModel m = trainer.train(duration, opts_.interval, deps_.clock, next_sample, token, &rows);
    if (stop_.stop_requested()) throw DetectorStoppedError();
    if (token.stop_requested()) throw TrainingCancelledError(rows.size());
    m.trained_at_ms = deps_.clock.wall_ms();
    auto published = std::make_shared<const TrainedModel>(std::move(m));
    publish_model(published);
    baseline_ = std::move(rows);
  } catch (const DetectorStoppedError&) {
    publish_model(nullptr);
    set_state(DetectorState::Stopped);
    throw;
  } catch (const TrainingCancelledError& e) {
    RW_LOG_INFO("Detector", "%s; no model published", e.what());
    publish_model(nullptr);
    baseline_.clear();
    set_state(stop_.stop_requested() ? DetectorState::Stopped : DetectorState::Idle);
    throw;
  } catch (const InsufficientDataError& e) {
    RW_LOG_ERROR("Detector", "%s", e.what());
    publish_model(nullptr);
    baseline_.clear();
    set_state(stop_.stop_requested() ? DetectorState::Stopped : DetectorState::Idle);
    throw;
  } catch (const std::exception& e) {
    RW_LOG_ERROR("Detector", "training failed: %s", e.what());
    publish_model(nullptr);
    baseline_.clear();
    set_state(stop_.stop_requested() ? DetectorState::Stopped : DetectorState::Idle);
    throw;
  }

  if (deps_.storage) {
    deps_.storage->save(*model());
    deps_.storage->save_baseline(baseline_);
  }
  set_state(DetectorState::Ready);
}

DetectionResult Detector::tick_once() {
  AggregatedTick agg = collect_and_aggregate();
  Verdict v = analyzer_.score(agg.features);

  DetectionResult r{};
  r.tick = ++tick_;
  r.metrics = agg.metrics;
  r.features = agg.features;
  r.is_anomaly = v.is_anomaly;
  r.score = v.score;
  r.raw_score = v.raw_score;
  r.suppressed = v.suppressed;
  r.suspicious = std::move(agg.suspicious);
  r.factors = std::move(v.factors);
  r.file_counts = agg.file_counts;
  r.file_overflow = agg.file_overflow;
  r.file_available = agg.file_available;
  r.cutoff = v.cutoff;
  r.timestamp_ms = agg.metrics.timestamp_ms;

  if (r.is_anomaly)
    RW_LOG_WARN("Detector", "tick %llu anomalous (score %.4f, %zu suspicious processes)",
                static_cast<unsigned long long>(r.tick), r.score, r.suspicious.size());
  else
    RW_LOG_DEBUG("Detector", "tick %llu score %.4f%s", static_cast<unsigned long long>(r.tick), r.score,
                 r.suppressed ? " (below noise floor)" : "");
  return r;
}

DetectionResult Detector::detect() {
  DetectorState s = state();
  if (s == DetectorState::Stopped) throw DetectorStoppedError();
  if (s == DetectorState::Training) throw DetectorError("detect() called while training");
  if (!analyzer_.has_model()) throw ModelNotTrainedError();
  if (s == DetectorState::Ready) set_state(DetectorState::Detecting);

  const auto token = stop_.get_token();
  std::string last_error;
  for (int attempt = 1; attempt <= opts_.max_consecutive_failures; ++attempt) {
    try {
      if (!aggregator_.primed()) prime(token);
      DetectionResult r = tick_once();
      if (deps_.storage) deps_.storage->append(r);
      return r;
    } catch (const ModelNotTrainedError&) {
      throw;
    } catch (const std::exception& e) {
      last_error = e.what();
      RW_LOG_WARN("Detector", "tick failed (attempt %d/%d): %s", attempt, opts_.max_consecutive_failures,
                  last_error.c_str());
    }
    if (attempt == opts_.max_consecutive_failures) break;
    deps_.clock.sleep_until(deps_.clock.now() + opts_.retry_backoff, token);
    if (token.stop_requested()) throw DetectorStoppedError();
  }
  set_state(DetectorState::Stopped);
  stop_.request_stop();
  ConsecutiveTickFailure err(opts_.max_consecutive_failures, last_error);
  RW_LOG_ERROR("Detector", "%s", err.what());
  throw err;
}

uint64_t Detector::run(std::stop_token st, const ResultFn& on_result, uint64_t max_ticks) {
  if (state() == DetectorState::Stopped) throw DetectorStoppedError();
  LinkedStop linked(st, stop_.get_token());
  const auto token = linked.token();

  uint64_t delivered = 0;
  // a primed aggregator already holds a sample; keep the cadence from it
  auto next = aggregator_.primed() ? last_sample_at_ + opts_.interval : deps_.clock.now();
  while (!token.stop_requested()) {
    if (deps_.clock.now() < next) {
      deps_.clock.sleep_until(next, token);
      if (token.stop_requested()) break;
    }
    DetectionResult r = detect();
    // deadline counts from when this tick's collection began
    next = last_sample_at_ + opts_.interval;
    if (on_result) on_result(r);
    ++delivered;
    if (max_ticks != 0 && delivered >= max_ticks) return delivered;
  }
  if (st.stop_requested()) stop();
  return delivered;
}

void Detector::stop() {
  stop_.request_stop();
  set_state(DetectorState::Stopped);
}

} // namespace ransomwatch::app
