#pragma once

#include "app/Detector.hpp"
#include "app/ThresholdPolicy.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace ransomwatch::ui {

// Resolved runtime configuration: TOML file -> RANSOMWATCH_* env -> default.
struct AppConfig {
  struct Detector {
    int training_seconds{300};
    double interval_seconds{5.0};
    double contamination{0.1};
    int top_n{5};
    int min_training_samples{10};
    int max_consecutive_failures{5};
    int retry_backoff_ms{250};
    int trees{200};
    int max_samples{256};
    int seed{42};
    bool parallel_collect{true};
  } detector;

  struct Ranking {
    double weight_cpu{0.3};
    double weight_io{0.4};
    double weight_files{0.3};
  } ranking;

  struct Thresholds {
    double disk_reference_mbps{0.0};
    double file_event_reference{100.0};
    double high_process_cpu_pct{85.0};
    double score_margin{0.0};
    double score_std_margin{2.0};
    double range_tolerance{1.0};
  } thresholds;

  struct Monitor {
    std::vector<std::string> paths;
    int max_watches{8192};
    bool attribution{true};
  } monitor;

  std::vector<std::string> whitelist;

  struct Storage {
    bool enabled{true};
    std::string data_dir;
  } storage;

  int alert_cooldown_seconds{300};
  int metrics_port{0};

  struct Log {
    std::string level{"info"};
    std::string file{"auto"};   // "auto" = <data_dir>/logs/ransomwatch_YYYYMMDD.log, "" = off
  } log;

  std::string source;           // config file actually read, empty if none
};

// Reads the config file (path_override, else config_file_path()) and the
// environment, then clamps out-of-range values with a warning.
[[nodiscard]] AppConfig load_config(const std::string& path_override = {});

// Range checks shared by load_config and the command line. Bad values
// are reset to their default or clamped; each fix is logged.
void sanitize(AppConfig& c);

[[nodiscard]] ransomwatch::app::DetectorOptions detector_options(const AppConfig& c);
[[nodiscard]] ransomwatch::app::ThresholdOptions threshold_options(const AppConfig& c);
[[nodiscard]] std::string resolve_log_file(const AppConfig& c);

std::string config_file_path();
std::string default_data_dir();

// Environment variable helpers
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);
double getenv_double(const char* name, double defv);

} // namespace ransomwatch::ui
