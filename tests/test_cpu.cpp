#include "minitest.hpp"
#include "collectors/CpuCollector.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

static fs::path make_root_cpu() {
  auto root = fs::temp_directory_path() / fs::path("ransomwatch_test_cpu_") / fs::path(std::to_string(::getpid()));
  fs::create_directories(root / "proc");
  return root;
}

TEST(cpu_collector_first_sample_is_baseline) {
  auto root = make_root_cpu();
  std::ofstream(root / "proc/stat") << "cpu  100 0 100 1000 0 0 0 0\n"
                                        "cpu0 50 0 50 500 0 0 0 0\n"
                                        "cpu1 50 0 50 500 0 0 0 0\n"
                                        "intr 12345\n";
  setenv("RANSOMWATCH_PROC_ROOT", root.c_str(), 1);
  ransomwatch::collectors::CpuCollector c; ransomwatch::model::CpuSample s{};
  ASSERT_TRUE(c.sample(s));
  ASSERT_NEAR(s.usage_pct, 0.0, 1e-9);
  ASSERT_EQ(s.logical_cpus, 2);
}

TEST(cpu_collector_delta_usage) {
  auto root = make_root_cpu();
  std::ofstream(root / "proc/stat") << "cpu  100 0 100 1000 0 0 0 0\n"
                                        "cpu0 100 0 100 1000 0 0 0 0\n";
  setenv("RANSOMWATCH_PROC_ROOT", root.c_str(), 1);
  ransomwatch::collectors::CpuCollector c; ransomwatch::model::CpuSample s{};
  ASSERT_TRUE(c.sample(s));
  std::ofstream(root / "proc/stat") << "cpu  150 0 150 1100 0 0 0 0\n"
                                        "cpu0 150 0 150 1100 0 0 0 0\n";
  ASSERT_TRUE(c.sample(s));
  ASSERT_TRUE(s.usage_pct > 40.0 && s.usage_pct < 60.0);
}

TEST(cpu_collector_missing_stat_fails) {
  auto root = make_root_cpu();
  fs::remove(root / "proc/stat");
  setenv("RANSOMWATCH_PROC_ROOT", root.c_str(), 1);
  ransomwatch::collectors::CpuCollector c; ransomwatch::model::CpuSample s{};
  ASSERT_TRUE(!c.sample(s));
  ASSERT_EQ(ransomwatch::collectors::read_logical_cpu_count(), 1);
}
