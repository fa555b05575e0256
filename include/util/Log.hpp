#pragma once
#include <chrono>
#include <string>
#include <string_view>

namespace ransomwatch::util {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

void set_log_level(LogLevel level);
[[nodiscard]] LogLevel log_level();
[[nodiscard]] bool parse_log_level(std::string_view s, LogLevel& out);
[[nodiscard]] const char* log_level_name(LogLevel level);

// Mirror every emitted line into a file (append). Returns false when the
// file cannot be opened; stderr logging continues either way.
bool open_log_file(const std::string& path);
void close_log_file();

// Lines look like: "ransomwatch: [warn] SystemCollector: disk read failed"
void log_msg(LogLevel level, const char* component, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));

#define RW_LOG_DEBUG(comp, ...) ::ransomwatch::util::log_msg(::ransomwatch::util::LogLevel::Debug, comp, __VA_ARGS__)
#define RW_LOG_INFO(comp, ...)  ::ransomwatch::util::log_msg(::ransomwatch::util::LogLevel::Info,  comp, __VA_ARGS__)
#define RW_LOG_WARN(comp, ...)  ::ransomwatch::util::log_msg(::ransomwatch::util::LogLevel::Warn,  comp, __VA_ARGS__)
#define RW_LOG_ERROR(comp, ...) ::ransomwatch::util::log_msg(::ransomwatch::util::LogLevel::Error, comp, __VA_ARGS__)

// Allows one message per period; used for recurring collector failures.
class LogThrottle {
public:
  explicit LogThrottle(std::chrono::seconds period = std::chrono::seconds(10)) : period_(period) {}
  [[nodiscard]] bool allow(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now()) {
    if (last_.time_since_epoch().count() != 0 && now - last_ < period_) { ++suppressed_; return false; }
    last_ = now;
    return true;
  }
  // Messages swallowed since the last allowed one; resets on read.
  size_t take_suppressed() { auto n = suppressed_; suppressed_ = 0; return n; }
private:
  std::chrono::seconds period_;
  std::chrono::steady_clock::time_point last_{};
  size_t suppressed_{0};
};

} // namespace ransomwatch::util
