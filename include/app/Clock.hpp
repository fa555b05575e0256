#pragma once
#include <chrono>
#include <stop_token>

namespace ransomwatch::app {

// Time source for the detector. Injected so tests can run training
// windows and tick cadences without sleeping.
class IClock {
public:
  using time_point = std::chrono::steady_clock::time_point;
  virtual ~IClock() = default;
  [[nodiscard]] virtual time_point now() const = 0;
  [[nodiscard]] virtual int64_t wall_ms() const = 0;
  // Returns early when st is stopped.
  virtual void sleep_until(time_point deadline, const std::stop_token& st) = 0;
};

class SteadyClock : public IClock {
public:
  time_point now() const override { return std::chrono::steady_clock::now(); }
  int64_t wall_ms() const override;
  void sleep_until(time_point deadline, const std::stop_token& st) override;
};

} // namespace ransomwatch::app
