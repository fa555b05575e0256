#include "app/Clock.hpp"
#include <algorithm>
#include <thread>

namespace ransomwatch::app {

int64_t SteadyClock::wall_ms() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
}

void SteadyClock::sleep_until(time_point deadline, const std::stop_token& st) {
  using namespace std::chrono;
  // sliced so a stop request is noticed within 100ms
  while (!st.stop_requested()) {
    auto now = steady_clock::now();
    if (now >= deadline) return;
    auto slice = std::min<steady_clock::duration>(deadline - now, milliseconds(100));
    std::this_thread::sleep_for(slice);
  }
}

} // namespace ransomwatch::app
