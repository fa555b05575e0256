#include "minitest.hpp"
#include "app/MetricsServer.hpp"
#include <string>

using ransomwatch::app::detection_to_prometheus;
using namespace ransomwatch::model;

static int count_of(const std::string& hay, const std::string& needle) {
  int n = 0;
  for (size_t pos = hay.find(needle); pos != std::string::npos; pos = hay.find(needle, pos + 1)) ++n;
  return n;
}

TEST(prometheus_verdict_gauges) {
  DetectionResult r{};
  r.tick = 17;
  r.is_anomaly = true;
  r.score = -3.25;
  r.raw_score = -0.71;
  std::string out = detection_to_prometheus(r);
  ASSERT_TRUE(out.find("# TYPE ransomwatch_tick counter") != std::string::npos);
  ASSERT_TRUE(out.find("ransomwatch_tick 17\n") != std::string::npos);
  ASSERT_TRUE(out.find("# TYPE ransomwatch_anomaly gauge") != std::string::npos);
  ASSERT_TRUE(out.find("ransomwatch_anomaly 1\n") != std::string::npos);
  ASSERT_TRUE(out.find("ransomwatch_anomaly_score -3.25\n") != std::string::npos);
  ASSERT_TRUE(out.find("ransomwatch_isolation_score -0.71\n") != std::string::npos);
  ASSERT_TRUE(out.find("ransomwatch_suppressed 0\n") != std::string::npos);
}

TEST(prometheus_system_and_file_metrics) {
  DetectionResult r{};
  r.metrics.cpu_pct = 42.5;
  r.metrics.disk_write_bps = 1048576;
  r.file_counts = {3, 10, 0, 7};
  r.file_overflow = true;
  std::string out = detection_to_prometheus(r);
  ASSERT_TRUE(out.find("ransomwatch_cpu_usage_percent 42.5\n") != std::string::npos);
  ASSERT_TRUE(out.find("ransomwatch_disk_write_bytes_per_second 1048576\n") != std::string::npos);
  ASSERT_TRUE(out.find("ransomwatch_file_events{kind=\"created\"} 3\n") != std::string::npos);
  ASSERT_TRUE(out.find("ransomwatch_file_events{kind=\"renamed\"} 7\n") != std::string::npos);
  ASSERT_TRUE(out.find("ransomwatch_file_events_overflow 1\n") != std::string::npos);
  ASSERT_TRUE(out.find("ransomwatch_file_events_available 1\n") != std::string::npos);
  r.file_available = false;
  ASSERT_TRUE(detection_to_prometheus(r).find("ransomwatch_file_events_available 0\n") != std::string::npos);
  ASSERT_EQ(count_of(out, "ransomwatch_feature{name="), static_cast<int>(kFeatureCount));
  ASSERT_TRUE(out.find("ransomwatch_feature{name=\"disk_write_rate\"}") != std::string::npos);
}

TEST(prometheus_factors_and_processes) {
  DetectionResult r{};
  r.factors = {"disk_write_rate", "files_renamed_rate"};
  for (int i = 0; i < 3; ++i) {
    ProcessInfo p{};
    p.pid = 100 + i;
    p.name = i == 0 ? std::string("evil \"quoted\" name that is far longer than thirty-two chars") : "p" + std::to_string(i);
    p.suspicion = 0.5 / static_cast<double>(1 << i);
    p.file_writes = 12;
    r.suspicious.push_back(p);
  }
  std::string out = detection_to_prometheus(r);
  ASSERT_TRUE(out.find("ransomwatch_anomaly_factor{feature=\"files_renamed_rate\"} 1\n") != std::string::npos);
  ASSERT_EQ(count_of(out, "ransomwatch_process_suspicion{"), 3);
  ASSERT_EQ(count_of(out, "ransomwatch_process_file_writes{"), 3);
  ASSERT_TRUE(out.find("{pid=\"101\",name=\"p1\"} 0.25\n") != std::string::npos);
  ASSERT_TRUE(out.find("name=\"evil \\\"quoted\\\" name that is far l\"") != std::string::npos);
}

TEST(prometheus_quiet_tick_omits_optional_families) {
  DetectionResult r{};
  std::string out = detection_to_prometheus(r);
  ASSERT_TRUE(!out.empty());
  ASSERT_TRUE(out.find("ransomwatch_anomaly 0\n") != std::string::npos);
  ASSERT_TRUE(out.find("ransomwatch_anomaly_factor") == std::string::npos);
  ASSERT_TRUE(out.find("ransomwatch_process_suspicion") == std::string::npos);
}
