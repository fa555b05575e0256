#include "util/Log.hpp"

#include <atomic>
#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

namespace ransomwatch::util {

namespace {
std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_mu;
std::FILE* g_file = nullptr;
}

void set_log_level(LogLevel level) { g_level.store(static_cast<int>(level), std::memory_order_relaxed); }

LogLevel log_level() { return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed)); }

bool parse_log_level(std::string_view s, LogLevel& out) {
  if (s == "debug") { out = LogLevel::Debug; return true; }
  if (s == "info")  { out = LogLevel::Info;  return true; }
  if (s == "warn" || s == "warning") { out = LogLevel::Warn; return true; }
  if (s == "error") { out = LogLevel::Error; return true; }
  return false;
}

const char* log_level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
  }
  return "info";
}

bool open_log_file(const std::string& path) {
  std::lock_guard<std::mutex> lk(g_mu);
  if (g_file) { std::fclose(g_file); g_file = nullptr; }
  g_file = std::fopen(path.c_str(), "a");
  if (!g_file) {
    std::fprintf(stderr, "ransomwatch: [warn] Log: cannot open %s: %s\n", path.c_str(), std::strerror(errno));
    return false;
  }
  return true;
}

void close_log_file() {
  std::lock_guard<std::mutex> lk(g_mu);
  if (g_file) { std::fclose(g_file); g_file = nullptr; }
}

void log_msg(LogLevel level, const char* component, const char* fmt, ...) {
  if (static_cast<int>(level) < g_level.load(std::memory_order_relaxed)) return;
  char body[1024];
  va_list ap;
  va_start(ap, fmt);
  std::vsnprintf(body, sizeof(body), fmt, ap);
  va_end(ap);

  std::lock_guard<std::mutex> lk(g_mu);
  std::fprintf(stderr, "ransomwatch: [%s] %s: %s\n", log_level_name(level), component, body);
  if (g_file) {
    // file lines carry a local timestamp
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    ::localtime_r(&t, &tm);
    char ts[32];
    std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm);
    std::fprintf(g_file, "%s [%s] %s: %s\n", ts, log_level_name(level), component, body);
    std::fflush(g_file);
  }
}

} // namespace ransomwatch::util
