#include "minitest.hpp"
#include "ui/Formatting.hpp"
#include "ui/StatusRenderer.hpp"

using namespace ransomwatch::ui;

TEST(display_cols_counts_code_points) {
  ASSERT_EQ(display_cols("hello"), 5);
  ASSERT_EQ(display_cols("café"), 4);
  ASSERT_EQ(display_cols("größe"), 5);
  ASSERT_EQ(display_cols(""), 0);
  ASSERT_EQ(u8_len(static_cast<unsigned char>('a')), 1);
  ASSERT_EQ(u8_len(0xC3), 2);
  ASSERT_EQ(u8_len(0xE6), 3);
  ASSERT_EQ(u8_len(0xF0), 4);
}

TEST(take_cols_never_splits_a_sequence) {
  ASSERT_EQ(take_cols("größe", 3), std::string("grö"));
  ASSERT_EQ(take_cols("abc", 10), std::string("abc"));
  ASSERT_EQ(take_cols("abc", 0), std::string());
  // truncated multi-byte lead at the end is copied byte-wise
  std::string broken = "ab\xC3";
  ASSERT_EQ(take_cols(broken, 5), broken);
}

TEST(trunc_pad_and_rpad_trunc) {
  ASSERT_EQ(trunc_pad("bash", 6), std::string("bash  "));
  ASSERT_EQ(trunc_pad("encryptor", 6), std::string("encry."));
  ASSERT_EQ(trunc_pad("x", 0), std::string());
  ASSERT_EQ(rpad_trunc("42", 5), std::string("   42"));
  ASSERT_EQ(rpad_trunc("123456", 4), std::string("1234"));
}

TEST(format_bytes_and_rates) {
  ASSERT_EQ(format_bytes(512), std::string("512 B"));
  ASSERT_EQ(format_bytes(-3), std::string("0 B"));
  ASSERT_EQ(format_bytes(12.3 * 1024), std::string("12.3 KB"));
  ASSERT_EQ(format_bytes(4.0 * 1024 * 1024), std::string("4.0 MB"));
  ASSERT_EQ(format_rate(200.0 * 1024 * 1024), std::string("200.0 MB/s"));
}

TEST(format_timestamp_shape) {
  auto s = format_timestamp(1700000000000);
  ASSERT_EQ(s.size(), 19u);
  ASSERT_EQ(s[4], '-');
  ASSERT_EQ(s[10], ' ');
  ASSERT_EQ(s[13], ':');
}

TEST(render_status_anomaly_block) {
  ransomwatch::model::DetectionResult r{};
  r.tick = 12;
  r.timestamp_ms = 1700000000000;
  r.metrics.cpu_pct = 91.0;
  r.metrics.disk_write_bps = 200.0 * 1024 * 1024;
  r.is_anomaly = true;
  r.score = -12.5;
  r.raw_score = -0.7;
  r.cutoff = -0.0625;
  r.factors = {"disk_write_rate"};
  r.file_counts = {0, 5, 0, 40};
  r.file_overflow = true;
  ransomwatch::model::ProcessInfo p{};
  p.pid = 4242; p.name = "encryptor"; p.cpu_pct = 95.0; p.io_bps = 1024; p.has_io = true; p.file_writes = 40; p.suspicion = 0.7;
  r.suspicious.push_back(p);
  std::vector<ransomwatch::app::Alert> alerts{{"crit", "Anomalous activity"}};

  auto out = render_status(r, alerts, ransomwatch::app::DetectorState::Detecting);
  ASSERT_TRUE(out.find("tick 12 (detecting)") != std::string::npos);
  ASSERT_TRUE(out.find("W 200.0 MB/s") != std::string::npos);
  ASSERT_TRUE(out.find("renamed 40") != std::string::npos);
  ASSERT_TRUE(out.find("(overflow)") != std::string::npos);
  ASSERT_TRUE(out.find("score -12.5000  cutoff -0.0625") != std::string::npos);
  ASSERT_TRUE(out.find("-> ANOMALY") != std::string::npos);
  ASSERT_TRUE(out.find("factors: disk_write_rate") != std::string::npos);
  ASSERT_TRUE(out.find("encryptor") != std::string::npos);
  ASSERT_TRUE(out.find("1.0 KB/s") != std::string::npos);
  ASSERT_TRUE(out.find("[crit] Anomalous activity") != std::string::npos);
}

TEST(render_status_suppressed_tick) {
  ransomwatch::model::DetectionResult r{};
  r.suppressed = true;
  r.score = -0.2;
  auto out = render_status(r, {}, ransomwatch::app::DetectorState::Detecting);
  ASSERT_TRUE(out.find("normal (below noise floor)") != std::string::npos);
  ASSERT_TRUE(out.find("PID") == std::string::npos);
  ASSERT_TRUE(out.find("(unavailable)") == std::string::npos);
  r.file_available = false;
  out = render_status(r, {}, ransomwatch::app::DetectorState::Detecting);
  ASSERT_TRUE(out.find("(unavailable)") != std::string::npos);
}

TEST(render_model_check_lists_problems_and_live_tick) {
  ransomwatch::app::ModelCheck bad{};
  bad.problems = {"offset 5 outside [-1, 0]"};
  auto s = ransomwatch::ui::render_model_check(bad);
  ASSERT_TRUE(s.find("model check: INVALID") != std::string::npos);
  ASSERT_TRUE(s.find("  - offset 5 outside [-1, 0]") != std::string::npos);
  ASSERT_TRUE(s.find("live tick") == std::string::npos);

  ransomwatch::app::ModelCheck good{};
  ransomwatch::app::Verdict v{};
  v.score = 0.125; v.cutoff = -0.05; v.raw_score = -0.4;
  good.live = v;
  s = ransomwatch::ui::render_model_check(good);
  ASSERT_TRUE(s.find("model check: valid") != std::string::npos);
  ASSERT_TRUE(s.find("live tick: score +0.1250  cutoff -0.0500  isolation -0.4000  -> normal") != std::string::npos);
}
