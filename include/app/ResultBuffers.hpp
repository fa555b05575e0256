#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include "model/Detection.hpp"

namespace ransomwatch::app {

// Latest published DetectionResult, shared between the detector loop
// (single writer) and readers such as the metrics endpoint. Readers get
// an immutable snapshot that stays valid after the next publish.
class ResultBuffers {
public:
  ResultBuffers() = default;
  ResultBuffers(const ResultBuffers&) = delete;
  ResultBuffers& operator=(const ResultBuffers&) = delete;

  void publish(ransomwatch::model::DetectionResult result);

  // nullptr until the first publish
  [[nodiscard]] std::shared_ptr<const ransomwatch::model::DetectionResult> front() const;
  [[nodiscard]] uint64_t seq() const { return seq_.load(std::memory_order_acquire); }

private:
  mutable std::mutex mu_;
  std::shared_ptr<const ransomwatch::model::DetectionResult> front_;
  std::atomic<uint64_t> seq_{0};
};

} // namespace ransomwatch::app
