#pragma once
#include "app/BaselineTrainer.hpp"
#include "app/Clock.hpp"
#include "app/FeatureAggregator.hpp"
#include "app/OnlineAnalyzer.hpp"
#include "app/Storage.hpp"
#include "app/ThresholdPolicy.hpp"
#include "app/TrainedModel.hpp"
#include "app/Whitelist.hpp"
#include "collectors/IFileActivityCollector.hpp"
#include "collectors/IProcessCollector.hpp"
#include "collectors/ISystemCollector.hpp"
#include "model/Detection.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <vector>

namespace ransomwatch::app {

enum class DetectorState : uint8_t { Idle, Training, Ready, Detecting, Stopped };

[[nodiscard]] const char* state_name(DetectorState s);

struct DetectorOptions {
  std::chrono::milliseconds interval{5000};
  double contamination{0.1};
  size_t top_n{5};
  size_t min_training_samples{10};
  int max_consecutive_failures{5};
  std::chrono::milliseconds retry_backoff{250};
  ForestParams forest{};
  RankingWeights weights{};
  bool parallel_collect{true};

  // Throws std::invalid_argument.
  void validate() const;
};

struct DetectorDeps {
  ransomwatch::collectors::ISystemCollector& system;
  ransomwatch::collectors::IProcessCollector& processes;
  ransomwatch::collectors::IFileActivityCollector& files;
  IClock& clock;
  IStorage* storage{nullptr};   // optional, best effort
};

// Train/detect lifecycle:
//   Idle -> Training -> Ready -> Detecting (self-loop per tick) -> Stopped
// Training is exclusive and publishes the model once it succeeds. A
// detect() tick that fails is retried after a backoff; exhausting the
// retry budget moves the detector to Stopped.
class Detector {
public:
  using ResultFn = std::function<void(const ransomwatch::model::DetectionResult&)>;

  Detector(DetectorOptions opts, Thresholds thresholds, DetectorDeps deps, ProcessWhitelist whitelist = {});
  Detector(const Detector&) = delete;
  Detector& operator=(const Detector&) = delete;

  // Idle -> Ready when storage holds a compatible model. Returns false
  // (state unchanged) otherwise.
  bool initialize();

  // Blocks for `duration`. Allowed from Idle, Ready and Detecting.
  // Throws InsufficientDataError (state Idle, previous model discarded),
  // TrainingCancelledError when `st` fires mid-window (state Idle, nothing
  // published or saved), DetectorStoppedError, or whatever fitting raised
  // (state Idle).
  void train(std::chrono::milliseconds duration, std::stop_token st = {});

  // One tick. Throws ModelNotTrainedError, DetectorStoppedError or
  // ConsecutiveTickFailure.
  [[nodiscard]] ransomwatch::model::DetectionResult detect();

  // Ticks every options.interval until st is stopped, stop() is called or
  // max_ticks (0 = unbounded) results were delivered. Tick starts are
  // scheduled against absolute deadlines. Cancellation through st moves
  // the detector to Stopped. Returns the number of ticks delivered.
  uint64_t run(std::stop_token st, const ResultFn& on_result, uint64_t max_ticks = 0);

  void stop();

  [[nodiscard]] DetectorState state() const { return state_.load(std::memory_order_acquire); }
  [[nodiscard]] std::shared_ptr<const TrainedModel> model() const;
  [[nodiscard]] const std::vector<ransomwatch::model::FeatureVector>& last_baseline() const { return baseline_; }
  [[nodiscard]] uint64_t ticks() const { return tick_; }
  [[nodiscard]] const Thresholds& thresholds() const { return th_; }
  [[nodiscard]] const DetectorOptions& options() const { return opts_; }

private:
  TickInput collect();
  AggregatedTick collect_and_aggregate();
  ransomwatch::model::DetectionResult tick_once();
  void prime(const std::stop_token& st);
  void publish_model(std::shared_ptr<const TrainedModel> m);
  void set_state(DetectorState s);

  DetectorOptions opts_;
  Thresholds th_;
  DetectorDeps deps_;
  FeatureAggregator aggregator_;
  OnlineAnalyzer analyzer_;

  std::atomic<DetectorState> state_{DetectorState::Idle};
  std::stop_source stop_;
  mutable std::mutex model_mu_;
  std::shared_ptr<const TrainedModel> model_;
  std::vector<ransomwatch::model::FeatureVector> baseline_;
  uint64_t tick_{0};
  IClock::time_point last_sample_at_{};
};

} // namespace ransomwatch::app
