#include "app/ResultBuffers.hpp"

namespace ransomwatch::app {

void ResultBuffers::publish(ransomwatch::model::DetectionResult result) {
  auto next = std::make_shared<const ransomwatch::model::DetectionResult>(std::move(result));
  {
    std::lock_guard<std::mutex> lk(mu_);
    front_.swap(next);
  }
  seq_.fetch_add(1, std::memory_order_release);
  // previous result (now in next) is released outside the lock
}

std::shared_ptr<const ransomwatch::model::DetectionResult> ResultBuffers::front() const {
  std::lock_guard<std::mutex> lk(mu_);
  return front_;
}

} // namespace ransomwatch::app
