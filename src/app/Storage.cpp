#include "app/Storage.hpp"
#include "app/Errors.hpp"
#include "app/MetricsServer.hpp"
#include "util/Log.hpp"

#include <charconv>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>

using ransomwatch::model::FeatureVector;
using ransomwatch::model::kFeatureCount;

namespace ransomwatch::app {

namespace {

constexpr const char* kMagic = "ransomwatch-model";
constexpr size_t kMaxTrees = 10000;
constexpr int kMaxSubsample = 1 << 20;

// shortest representation that reads back to the same double
std::string fmt_d(double v) {
  char buf[32];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  if (ec != std::errc{}) return "0";
  return std::string(buf, ptr);
}

template <typename T>
void expect(std::istream& in, const char* tag, T& value) {
  std::string got;
  if (!(in >> got) || got != tag) throw ModelFormatError(std::string("expected '") + tag + "', got '" + got + "'");
  if (!(in >> value)) throw ModelFormatError(std::string("bad value for '") + tag + "'");
}

void expect_tag(std::istream& in, const char* tag) {
  std::string got;
  if (!(in >> got) || got != tag) throw ModelFormatError(std::string("expected '") + tag + "', got '" + got + "'");
}

} // namespace

void write_model(std::ostream& out, const TrainedModel& m) {
  out << kMagic << ' ' << m.schema_version << '\n';
  out << "features " << m.feature_count << '\n';
  out << "interval_ms " << m.interval.count() << '\n';
  out << "contamination " << fmt_d(m.contamination) << '\n';
  out << "samples " << m.samples << '\n';
  out << "trained_at_ms " << m.trained_at_ms << '\n';
  out << "offset " << fmt_d(m.offset) << '\n';
  out << "score_stats " << fmt_d(m.train_score_mean) << ' ' << fmt_d(m.train_score_std) << '\n';
  out << "scaler_mean";
  for (double v : m.scaler.mean) out << ' ' << fmt_d(v);
  out << "\nscaler_scale";
  for (double v : m.scaler.scale) out << ' ' << fmt_d(v);
  out << '\n';
  for (size_t f = 0; f < kFeatureCount; ++f) {
    const auto& s = m.stats[f];
    out << "stat " << f << ' ' << fmt_d(s.min) << ' ' << fmt_d(s.max) << ' ' << fmt_d(s.mean) << ' ' << fmt_d(s.std) << '\n';
  }
  const auto& trees = m.forest.trees();
  out << "forest " << trees.size() << ' ' << m.forest.subsample() << '\n';
  for (const auto& t : trees) {
    out << "tt " << t.nodes.size() << '\n';
    for (size_t i = 0; i < t.nodes.size(); ++i) {
      const auto& n = t.nodes[i];
      out << i << ' ' << n.feature << ' ' << fmt_d(n.threshold) << ' ' << n.left << ' ' << n.right << ' ' << n.size << '\n';
    }
  }
  out << "end\n";
}

TrainedModel read_model(std::istream& in) {
  TrainedModel m{};
  expect(in, kMagic, m.schema_version);
  if (m.schema_version != ransomwatch::model::kFeatureSchemaVersion)
    throw ModelFormatError("schema version " + std::to_string(m.schema_version) + " is not supported");
  expect(in, "features", m.feature_count);
  if (m.feature_count != kFeatureCount)
    throw ModelFormatError("model has " + std::to_string(m.feature_count) + " features, expected " + std::to_string(kFeatureCount));
  int64_t interval_ms = 0;
  expect(in, "interval_ms", interval_ms);
  if (interval_ms <= 0) throw ModelFormatError("non-positive interval");
  m.interval = std::chrono::milliseconds(interval_ms);
  expect(in, "contamination", m.contamination);
  expect(in, "samples", m.samples);
  expect(in, "trained_at_ms", m.trained_at_ms);
  expect(in, "offset", m.offset);
  expect(in, "score_stats", m.train_score_mean);
  if (!(in >> m.train_score_std)) throw ModelFormatError("bad score_stats");
  expect_tag(in, "scaler_mean");
  for (auto& v : m.scaler.mean) if (!(in >> v)) throw ModelFormatError("bad scaler_mean");
  expect_tag(in, "scaler_scale");
  for (auto& v : m.scaler.scale) if (!(in >> v) || v == 0.0) throw ModelFormatError("bad scaler_scale");
  for (size_t f = 0; f < kFeatureCount; ++f) {
    size_t idx = 0;
    expect(in, "stat", idx);
    auto& s = m.stats[f];
    if (idx != f || !(in >> s.min >> s.max >> s.mean >> s.std)) throw ModelFormatError("bad stat line");
  }
  size_t ntrees = 0; int subsample = 0;
  expect(in, "forest", ntrees);
  if (!(in >> subsample) || subsample <= 0 || subsample > kMaxSubsample || ntrees == 0 || ntrees > kMaxTrees)
    throw ModelFormatError("bad forest header");
  std::vector<IsoTree> trees(ntrees);
  for (auto& t : trees) {
    size_t nn = 0;
    expect(in, "tt", nn);
    // a binary tree over `subsample` points has at most 2*subsample-1 nodes
    if (nn == 0 || nn >= 2 * static_cast<size_t>(subsample)) throw ModelFormatError("bad tree size " + std::to_string(nn));
    t.nodes.resize(nn);
    for (size_t i = 0; i < nn; ++i) {
      size_t idx = 0; auto& n = t.nodes[i];
      if (!(in >> idx >> n.feature >> n.threshold >> n.left >> n.right >> n.size) || idx != i)
        throw ModelFormatError("bad node line");
      const int count = static_cast<int>(nn);
      bool leaf = n.left < 0 && n.right < 0;
      bool inner = n.left > static_cast<int>(i) && n.left < count && n.right > static_cast<int>(i) && n.right < count &&
                   n.feature >= 0 && n.feature < static_cast<int>(kFeatureCount);
      if (!leaf && !inner) throw ModelFormatError("node " + std::to_string(i) + " has invalid links");
    }
  }
  expect_tag(in, "end");
  m.forest.assign(std::move(trees), subsample);
  return m;
}

FileStorage::FileStorage(std::filesystem::path data_dir) : dir_(std::move(data_dir)) {}

bool FileStorage::ensure_dir(const std::filesystem::path& p) const {
  std::error_code ec;
  std::filesystem::create_directories(p, ec);
  if (ec) {
    RW_LOG_WARN("FileStorage", "failed to create %s: %s", p.c_str(), ec.message().c_str());
    return false;
  }
  return true;
}

void FileStorage::save(const TrainedModel& model) {
  std::lock_guard<std::mutex> lk(mu_);
  auto path = model_path();
  if (!ensure_dir(path.parent_path())) return;
  auto tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      RW_LOG_WARN("FileStorage", "cannot write %s: %s", tmp.c_str(), std::strerror(errno));
      return;
    }
    write_model(out, model);
    out.flush();
    if (!out) {
      RW_LOG_WARN("FileStorage", "write to %s failed", tmp.c_str());
      return;
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    RW_LOG_WARN("FileStorage", "cannot replace %s: %s", path.c_str(), ec.message().c_str());
    return;
  }
  RW_LOG_INFO("FileStorage", "model saved to %s", path.c_str());
}

std::optional<TrainedModel> FileStorage::load() {
  std::lock_guard<std::mutex> lk(mu_);
  auto path = model_path();
  std::ifstream in(path);
  if (!in) {
    RW_LOG_INFO("FileStorage", "no saved model at %s", path.c_str());
    return std::nullopt;
  }
  try {
    auto m = read_model(in);
    RW_LOG_INFO("FileStorage", "loaded model from %s (%zu samples)", path.c_str(), m.samples);
    return m;
  } catch (const ModelFormatError& e) {
    RW_LOG_WARN("FileStorage", "ignoring %s: %s", path.c_str(), e.what());
    return std::nullopt;
  } catch (const std::exception& e) {
    RW_LOG_WARN("FileStorage", "cannot read %s: %s", path.c_str(), e.what());
    return std::nullopt;
  }
}

std::filesystem::path FileStorage::chunk_path(std::time_t t) const {
  std::tm tm{};
  ::localtime_r(&t, &tm);
  char buf[64];
  std::snprintf(buf, sizeof(buf), "ransomwatch_%04d-%02d-%02d_%02d.prom",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour);
  return dir_ / "history" / buf;
}

void FileStorage::append(const ransomwatch::model::DetectionResult& result) {
  std::lock_guard<std::mutex> lk(mu_);
  std::time_t t = result.timestamp_ms > 0 ? static_cast<std::time_t>(result.timestamp_ms / 1000) : std::time(nullptr);
  auto path = chunk_path(t);
  if (!ensure_dir(path.parent_path())) return;
  std::ofstream file(path, std::ios::app);
  if (!file) {
    RW_LOG_WARN("FileStorage", "failed to open %s: %s", path.c_str(), std::strerror(errno));
    return;
  }
  char ts_buf[32];
  auto [ptr, ec] = std::to_chars(ts_buf, ts_buf + sizeof(ts_buf), result.timestamp_ms);
  file << "# ransomwatch_timestamp_ms ";
  file.write(ts_buf, ptr - ts_buf);
  file.put('\n');
  std::string body = detection_to_prometheus(result);
  file.write(body.data(), static_cast<std::streamsize>(body.size()));
  file.flush();
  if (!file) RW_LOG_WARN("FileStorage", "write to %s failed", path.c_str());
}

CleanupReport FileStorage::cleanup() {
  std::lock_guard<std::mutex> lk(mu_);
  CleanupReport rep{};
  for (const char* name : {"logs", "history", "models", "training"}) {
    const auto dir = dir_ / name;
    std::error_code ec;
    if (std::filesystem::is_directory(dir, ec)) {
      std::vector<std::filesystem::path> entries;
      for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
        entries.push_back(it->path());
      if (ec) {
        RW_LOG_WARN("FileStorage", "cannot list %s: %s", dir.c_str(), ec.message().c_str());
        ++rep.failed;
        continue;
      }
      for (const auto& p : entries) {
        std::error_code rm_ec;
        std::filesystem::remove_all(p, rm_ec);
        if (rm_ec) {
          RW_LOG_WARN("FileStorage", "cannot remove %s: %s", p.c_str(), rm_ec.message().c_str());
          ++rep.failed;
        } else {
          ++rep.removed;
        }
      }
    }
    (void)ensure_dir(dir);  // failure already logged
  }
  RW_LOG_INFO("FileStorage", "cleaned %s: %zu entries removed, %zu failed", dir_.c_str(), rep.removed, rep.failed);
  return rep;
}

void FileStorage::save_baseline(const std::vector<FeatureVector>& rows) {
  std::lock_guard<std::mutex> lk(mu_);
  auto dir = dir_ / "training";
  if (!ensure_dir(dir)) return;
  std::time_t t = std::time(nullptr);
  std::tm tm{};
  ::localtime_r(&t, &tm);
  char name[64];
  std::strftime(name, sizeof(name), "baseline_%Y%m%d_%H%M%S.csv", &tm);
  std::ofstream out(dir / name, std::ios::trunc);
  if (!out) {
    RW_LOG_WARN("FileStorage", "cannot write baseline %s: %s", (dir / name).c_str(), std::strerror(errno));
    return;
  }
  for (size_t f = 0; f < kFeatureCount; ++f) out << (f ? "," : "") << ransomwatch::model::kFeatureNames[f];
  out << '\n';
  for (const auto& r : rows) {
    for (size_t f = 0; f < kFeatureCount; ++f) out << (f ? "," : "") << fmt_d(r[f]);
    out << '\n';
  }
  RW_LOG_INFO("FileStorage", "baseline of %zu samples written to %s", rows.size(), (dir / name).c_str());
}

} // namespace ransomwatch::app
