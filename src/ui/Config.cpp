#include "ui/Config.hpp"
#include "util/Log.hpp"
#include "util/TomlReader.hpp"
#include "app/Whitelist.hpp"
#include <cstdlib>
#include <ctime>
#include <stdexcept>
#include <string>

namespace ransomwatch::ui {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("RANSOMWATCH_", 0) == 0) {
    alt = std::string("ransomwatch_") + n.substr(12);
  } else if (n.rfind("ransomwatch_", 0) == 0) {
    alt = std::string("RANSOMWATCH_") + n.substr(12);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stoi(v); } catch (const std::exception&) {
    RW_LOG_WARN("Config", "%s=%s is not an integer; using %d", name, v, defv);
    return defv;
  }
}

double getenv_double(const char* name, double defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stod(v); } catch (const std::exception&) {
    RW_LOG_WARN("Config", "%s=%s is not a number; using %g", name, v, defv);
    return defv;
  }
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/ransomwatch/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/ransomwatch/config.toml";
  return {};
}

std::string default_data_dir() {
  if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg)
    return std::string(xdg) + "/ransomwatch";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.local/share/ransomwatch";
  return "ransomwatch-data";
}

using ransomwatch::util::TomlReader;

static int resolve_int(const TomlReader& toml, bool have_toml, const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

static double resolve_double(const TomlReader& toml, bool have_toml, const char* section, const char* key,
                             const char* env_name, double def) {
  if (have_toml && toml.has(section, key))
    return toml.get_double(section, key, def);
  if (env_name)
    return getenv_double(env_name, def);
  return def;
}

static bool resolve_bool(const TomlReader& toml, bool have_toml, const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

static std::string resolve_string(const TomlReader& toml, bool have_toml, const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

static std::vector<std::string> resolve_list(const TomlReader& toml, bool have_toml, const char* section,
                                             const char* key, const char* env_name) {
  if (have_toml && toml.has(section, key))
    return toml.get_list(section, key);
  if (env_name) {
    if (const char* v = getenv_compat(env_name))
      return ransomwatch::app::ProcessWhitelist::split_list(v);
  }
  return {};
}

template <typename T>
static void clamp_or_default(T& v, T lo, T hi, T def, const char* key) {
  if (v < lo || v > hi) {
    RW_LOG_WARN("Config", "%s out of range; using %g", key, static_cast<double>(def));
    v = def;
  }
}

void sanitize(AppConfig& c) {
  const AppConfig d{};
  clamp_or_default(c.detector.training_seconds, 1, 7 * 24 * 3600, d.detector.training_seconds, "detector.training_seconds");
  if (!(c.detector.interval_seconds > 0.0) || c.detector.interval_seconds > 3600.0) {
    RW_LOG_WARN("Config", "detector.interval_seconds out of range; using %g", d.detector.interval_seconds);
    c.detector.interval_seconds = d.detector.interval_seconds;
  } else if (c.detector.interval_seconds < 1.0) {
    RW_LOG_WARN("Config", "detection interval %.3gs is below the 1s minimum safe interval; rates will be noisy",
                c.detector.interval_seconds);
  }
  if (!(c.detector.contamination > 0.0 && c.detector.contamination < 0.5)) {
    RW_LOG_WARN("Config", "detector.contamination must be in (0, 0.5); using %g", d.detector.contamination);
    c.detector.contamination = d.detector.contamination;
  }
  clamp_or_default(c.detector.top_n, 1, 100, d.detector.top_n, "detector.top_n");
  clamp_or_default(c.detector.min_training_samples, 2, 1000000, d.detector.min_training_samples, "detector.min_training_samples");
  clamp_or_default(c.detector.max_consecutive_failures, 1, 1000, d.detector.max_consecutive_failures, "detector.max_consecutive_failures");
  clamp_or_default(c.detector.retry_backoff_ms, 0, 60000, d.detector.retry_backoff_ms, "detector.retry_backoff_ms");
  clamp_or_default(c.detector.trees, 1, 10000, d.detector.trees, "detector.trees");
  clamp_or_default(c.detector.max_samples, 2, 1000000, d.detector.max_samples, "detector.max_samples");

  auto& r = c.ranking;
  if (r.weight_cpu < 0.0 || r.weight_io < 0.0 || r.weight_files < 0.0 ||
      r.weight_cpu + r.weight_io + r.weight_files <= 0.0) {
    RW_LOG_WARN("Config", "ranking weights must be non-negative and not all zero; using defaults");
    r = d.ranking;
  }

  auto& t = c.thresholds;
  clamp_or_default(t.disk_reference_mbps, 0.0, 1e6, d.thresholds.disk_reference_mbps, "thresholds.disk_reference_mbps");
  if (!(t.file_event_reference > 0.0)) {
    RW_LOG_WARN("Config", "thresholds.file_event_reference must be positive; using %g", d.thresholds.file_event_reference);
    t.file_event_reference = d.thresholds.file_event_reference;
  }
  clamp_or_default(t.high_process_cpu_pct, 1.0, 10000.0, d.thresholds.high_process_cpu_pct, "thresholds.high_process_cpu_pct");
  clamp_or_default(t.score_margin, 0.0, 1.0, d.thresholds.score_margin, "thresholds.score_margin");
  clamp_or_default(t.score_std_margin, 0.0, 10.0, d.thresholds.score_std_margin, "thresholds.score_std_margin");
  clamp_or_default(t.range_tolerance, 0.0, 100.0, d.thresholds.range_tolerance, "thresholds.range_tolerance");

  clamp_or_default(c.monitor.max_watches, 1, 1 << 20, d.monitor.max_watches, "monitor.max_watches");
  clamp_or_default(c.alert_cooldown_seconds, 0, 86400, d.alert_cooldown_seconds, "alerts.cooldown_seconds");
  clamp_or_default(c.metrics_port, 0, 65535, d.metrics_port, "metrics.port");

  ransomwatch::util::LogLevel lvl{};
  if (!ransomwatch::util::parse_log_level(c.log.level, lvl)) {
    RW_LOG_WARN("Config", "unknown log.level '%s'; using info", c.log.level.c_str());
    c.log.level = "info";
  }
}

AppConfig load_config(const std::string& path_override) {
  AppConfig c{};
  TomlReader toml;
  auto path = path_override.empty() ? config_file_path() : path_override;
  bool have_toml = !path.empty() && toml.load(path);
  if (have_toml) c.source = path;
  else if (!path_override.empty()) RW_LOG_WARN("Config", "cannot read config file %s; using defaults", path.c_str());

  // --- [detector] ---
  auto& d = c.detector;
  d.training_seconds         = resolve_int(toml, have_toml, "detector", "training_seconds", "RANSOMWATCH_TRAINING_SECONDS", d.training_seconds);
  d.interval_seconds         = resolve_double(toml, have_toml, "detector", "interval_seconds", "RANSOMWATCH_INTERVAL_SECONDS", d.interval_seconds);
  d.contamination            = resolve_double(toml, have_toml, "detector", "contamination", "RANSOMWATCH_CONTAMINATION", d.contamination);
  d.top_n                    = resolve_int(toml, have_toml, "detector", "top_n", "RANSOMWATCH_TOP_N", d.top_n);
  d.min_training_samples     = resolve_int(toml, have_toml, "detector", "min_training_samples", "RANSOMWATCH_MIN_TRAINING_SAMPLES", d.min_training_samples);
  d.max_consecutive_failures = resolve_int(toml, have_toml, "detector", "max_consecutive_failures", "RANSOMWATCH_MAX_TICK_FAILURES", d.max_consecutive_failures);
  d.retry_backoff_ms         = resolve_int(toml, have_toml, "detector", "retry_backoff_ms", "RANSOMWATCH_RETRY_BACKOFF_MS", d.retry_backoff_ms);
  d.trees                    = resolve_int(toml, have_toml, "detector", "trees", "RANSOMWATCH_TREES", d.trees);
  d.max_samples              = resolve_int(toml, have_toml, "detector", "max_samples", "RANSOMWATCH_MAX_SAMPLES", d.max_samples);
  d.seed                     = resolve_int(toml, have_toml, "detector", "seed", "RANSOMWATCH_SEED", d.seed);
  d.parallel_collect         = resolve_bool(toml, have_toml, "detector", "parallel_collect", "RANSOMWATCH_PARALLEL_COLLECT", d.parallel_collect);

  // --- [ranking] ---
  c.ranking.weight_cpu   = resolve_double(toml, have_toml, "ranking", "weight_cpu", "RANSOMWATCH_WEIGHT_CPU", c.ranking.weight_cpu);
  c.ranking.weight_io    = resolve_double(toml, have_toml, "ranking", "weight_io", "RANSOMWATCH_WEIGHT_IO", c.ranking.weight_io);
  c.ranking.weight_files = resolve_double(toml, have_toml, "ranking", "weight_files", "RANSOMWATCH_WEIGHT_FILES", c.ranking.weight_files);

  // --- [thresholds] ---
  auto& t = c.thresholds;
  t.disk_reference_mbps  = resolve_double(toml, have_toml, "thresholds", "disk_reference_mbps", "RANSOMWATCH_DISK_REFERENCE_MBPS", t.disk_reference_mbps);
  t.file_event_reference = resolve_double(toml, have_toml, "thresholds", "file_event_reference", "RANSOMWATCH_FILE_EVENT_REFERENCE", t.file_event_reference);
  t.high_process_cpu_pct = resolve_double(toml, have_toml, "thresholds", "high_process_cpu_pct", "RANSOMWATCH_HIGH_PROCESS_CPU_PCT", t.high_process_cpu_pct);
  t.score_margin         = resolve_double(toml, have_toml, "thresholds", "score_margin", "RANSOMWATCH_SCORE_MARGIN", t.score_margin);
  t.score_std_margin     = resolve_double(toml, have_toml, "thresholds", "score_std_margin", "RANSOMWATCH_SCORE_STD_MARGIN", t.score_std_margin);
  t.range_tolerance      = resolve_double(toml, have_toml, "thresholds", "range_tolerance", "RANSOMWATCH_RANGE_TOLERANCE", t.range_tolerance);

  // --- [monitor] ---
  c.monitor.paths = resolve_list(toml, have_toml, "monitor", "paths", "RANSOMWATCH_MONITOR_PATHS");
  if (c.monitor.paths.empty()) {
    if (const char* home = std::getenv("HOME"); home && *home) c.monitor.paths.emplace_back(home);
  }
  c.monitor.max_watches = resolve_int(toml, have_toml, "monitor", "max_watches", "RANSOMWATCH_MAX_WATCHES", c.monitor.max_watches);
  c.monitor.attribution = resolve_bool(toml, have_toml, "monitor", "attribution", "RANSOMWATCH_ATTRIBUTION", c.monitor.attribution);

  // --- [whitelist] ---
  c.whitelist = resolve_list(toml, have_toml, "whitelist", "processes", "RANSOMWATCH_WHITELIST");

  // --- [storage] ---
  c.storage.enabled  = resolve_bool(toml, have_toml, "storage", "enabled", "RANSOMWATCH_STORAGE", c.storage.enabled);
  c.storage.data_dir = resolve_string(toml, have_toml, "storage", "data_dir", "RANSOMWATCH_DATA_DIR", default_data_dir());

  // --- [alerts] / [metrics] / [log] ---
  c.alert_cooldown_seconds = resolve_int(toml, have_toml, "alerts", "cooldown_seconds", "RANSOMWATCH_ALERT_COOLDOWN", c.alert_cooldown_seconds);
  c.metrics_port           = resolve_int(toml, have_toml, "metrics", "port", "RANSOMWATCH_METRICS_PORT", c.metrics_port);
  c.log.level = resolve_string(toml, have_toml, "log", "level", "RANSOMWATCH_LOG_LEVEL", c.log.level);
  if (have_toml && toml.has("log", "file")) c.log.file = toml.get_string("log", "file");
  else if (const char* v = std::getenv("RANSOMWATCH_LOG_FILE")) c.log.file = v;  // set-but-empty disables

  sanitize(c);
  return c;
}

ransomwatch::app::DetectorOptions detector_options(const AppConfig& c) {
  using namespace std::chrono;
  ransomwatch::app::DetectorOptions o{};
  o.interval = milliseconds(static_cast<int64_t>(c.detector.interval_seconds * 1000.0 + 0.5));
  if (o.interval <= milliseconds::zero()) o.interval = milliseconds(1);
  o.contamination = c.detector.contamination;
  o.top_n = static_cast<size_t>(c.detector.top_n);
  o.min_training_samples = static_cast<size_t>(c.detector.min_training_samples);
  o.max_consecutive_failures = c.detector.max_consecutive_failures;
  o.retry_backoff = milliseconds(c.detector.retry_backoff_ms);
  o.forest = ransomwatch::app::ForestParams{
    .trees = c.detector.trees,
    .max_samples = c.detector.max_samples,
    .seed = static_cast<uint64_t>(c.detector.seed),
  };
  o.weights = ransomwatch::app::RankingWeights{c.ranking.weight_cpu, c.ranking.weight_io, c.ranking.weight_files};
  o.parallel_collect = c.detector.parallel_collect;
  return o;
}

ransomwatch::app::ThresholdOptions threshold_options(const AppConfig& c) {
  return ransomwatch::app::ThresholdOptions{
    .disk_reference_mbps = c.thresholds.disk_reference_mbps,
    .file_event_reference = c.thresholds.file_event_reference,
    .high_process_cpu_pct = c.thresholds.high_process_cpu_pct,
    .score_margin = c.thresholds.score_margin,
    .score_std_margin = c.thresholds.score_std_margin,
    .range_tolerance = c.thresholds.range_tolerance,
  };
}

std::string resolve_log_file(const AppConfig& c) {
  if (c.log.file != "auto") return c.log.file;
  std::time_t now = std::time(nullptr);
  std::tm tm{};
  ::localtime_r(&now, &tm);
  char name[40];
  std::strftime(name, sizeof(name), "ransomwatch_%Y%m%d.log", &tm);
  return c.storage.data_dir + "/logs/" + name;
}

} // namespace ransomwatch::ui
