#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace ransomwatch::collectors {

// Remembers the last pid that modified each path on the mounts holding
// the monitored roots. Needs CAP_SYS_ADMIN; start() returns false
// without it and lookups then always miss.
class FanotifyAttributor {
public:
  FanotifyAttributor() = default;
  ~FanotifyAttributor();
  FanotifyAttributor(const FanotifyAttributor&) = delete;
  FanotifyAttributor& operator=(const FanotifyAttributor&) = delete;

  bool start(const std::vector<std::string>& roots);
  void stop();
  [[nodiscard]] bool active() const { return fd_ >= 0; }

  [[nodiscard]] std::optional<int32_t> lookup(const std::string& path) const;
  void record(const std::string& path, int32_t pid);

private:
  void run(std::stop_token st);

  int fd_{-1};
  std::jthread thread_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, int32_t> last_writer_;
  static constexpr size_t kMaxPaths = 65536;
};

} // namespace ransomwatch::collectors
