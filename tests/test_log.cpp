#include "minitest.hpp"
#include "util/Log.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace ransomwatch::util;
using namespace std::chrono_literals;

static std::filesystem::path log_path(const char* suffix) {
  return std::filesystem::temp_directory_path() /
         ("ransomwatch_log_test_" + std::to_string(::getpid()) + "_" + suffix + ".log");
}

static std::string slurp(const std::filesystem::path& p) {
  std::ifstream in(p);
  std::stringstream ss; ss << in.rdbuf();
  return ss.str();
}

TEST(log_level_parsing) {
  LogLevel l{};
  ASSERT_TRUE(parse_log_level("debug", l) && l == LogLevel::Debug);
  ASSERT_TRUE(parse_log_level("warning", l) && l == LogLevel::Warn);
  ASSERT_TRUE(parse_log_level("error", l) && l == LogLevel::Error);
  ASSERT_TRUE(!parse_log_level("loud", l));
  ASSERT_EQ(std::string(log_level_name(LogLevel::Info)), std::string("info"));
}

TEST(log_file_mirrors_lines_at_or_above_level) {
  auto path = log_path("mirror");
  std::filesystem::remove(path);
  const auto saved = log_level();
  set_log_level(LogLevel::Error);
  ASSERT_TRUE(open_log_file(path.string()));
  RW_LOG_WARN("Detector", "filtered %d", 1);
  RW_LOG_ERROR("Detector", "tick failed %d times", 5);
  close_log_file();
  set_log_level(saved);

  auto body = slurp(path);
  ASSERT_TRUE(body.find("filtered") == std::string::npos);
  ASSERT_TRUE(body.find("[error] Detector: tick failed 5 times\n") != std::string::npos);
  std::filesystem::remove(path);
}

TEST(log_file_unwritable_path) {
  ASSERT_TRUE(!open_log_file("/nonexistent-dir/ransomwatch/x.log"));
  close_log_file();
}

TEST(log_throttle_allows_one_per_period) {
  LogThrottle t(10s);
  auto t0 = std::chrono::steady_clock::time_point{} + 1h;
  ASSERT_TRUE(t.allow(t0));
  ASSERT_TRUE(!t.allow(t0 + 1s));
  ASSERT_TRUE(!t.allow(t0 + 9s));
  ASSERT_EQ(t.take_suppressed(), 2u);
  ASSERT_EQ(t.take_suppressed(), 0u);
  ASSERT_TRUE(t.allow(t0 + 10s));
}
