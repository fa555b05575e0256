#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace ransomwatch::app {

// Root of the detector's typed failures.
class DetectorError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// A collector backend cannot provide data at all (e.g. inotify_init
// failed). Caught by the collector wrappers; never reaches the caller.
class CollectorUnavailable : public DetectorError {
public:
  using DetectorError::DetectorError;
};

class InsufficientDataError : public DetectorError {
public:
  InsufficientDataError(size_t collected, size_t required)
    : DetectorError("insufficient training data: collected " + std::to_string(collected) +
                    " samples, need at least " + std::to_string(required)),
      collected_(collected), required_(required) {}
  [[nodiscard]] size_t collected() const noexcept { return collected_; }
  [[nodiscard]] size_t required() const noexcept { return required_; }
private:
  size_t collected_;
  size_t required_;
};

class ModelNotTrainedError : public DetectorError {
public:
  ModelNotTrainedError() : DetectorError("no trained model: call train() or initialize() first") {}
};

class ConsecutiveTickFailure : public DetectorError {
public:
  ConsecutiveTickFailure(int attempts, const std::string& last_error)
    : DetectorError("detection tick failed " + std::to_string(attempts) +
                    " consecutive times; last error: " + last_error),
      attempts_(attempts) {}
  [[nodiscard]] int attempts() const noexcept { return attempts_; }
private:
  int attempts_;
};

class DetectorStoppedError : public DetectorError {
public:
  DetectorStoppedError() : DetectorError("detector is stopped") {}
};

// The stop token fired before the training window elapsed. The rows
// collected so far are discarded.
class TrainingCancelledError : public DetectorError {
public:
  explicit TrainingCancelledError(size_t collected)
    : DetectorError("training cancelled after " + std::to_string(collected) + " samples"),
      collected_(collected) {}
  [[nodiscard]] size_t collected() const noexcept { return collected_; }
private:
  size_t collected_;
};

// Persisted model is malformed or incompatible with the running schema.
class ModelFormatError : public DetectorError {
public:
  using DetectorError::DetectorError;
};

} // namespace ransomwatch::app
