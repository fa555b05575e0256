#include "app/Alerts.hpp"
#include "app/Clock.hpp"
#include "app/Detector.hpp"
#include "app/Errors.hpp"
#include "app/ModelValidator.hpp"
#include "app/MetricsServer.hpp"
#include "app/ResultBuffers.hpp"
#include "app/Storage.hpp"
#include "app/ThresholdPolicy.hpp"
#include "app/Whitelist.hpp"
#include "collectors/FanotifyAttributor.hpp"
#include "collectors/InotifyFileCollector.hpp"
#include "collectors/ProcessCollector.hpp"
#include "collectors/SystemCollector.hpp"
#include "ui/Config.hpp"
#include "ui/StatusRenderer.hpp"
#include "util/Log.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
namespace app = ransomwatch::app;
namespace collectors = ransomwatch::collectors;
namespace ui = ransomwatch::ui;

static std::atomic<bool> g_stop{false};
static void on_signal(int) { g_stop.store(true); }

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFatal = 1;
constexpr int kExitUsage = 2;

struct CliOptions {
  std::optional<double> training_seconds;
  std::optional<double> interval_seconds;
  std::optional<double> contamination;
  std::optional<int> top_n;
  std::string config_path;
  std::optional<std::string> data_dir;
  std::vector<std::string> watch;
  std::optional<int> metrics_port;
  bool load_baseline{false};
  bool retrain{false};
  bool cleanup{false};
  bool validate_model{false};
  uint64_t iterations{0};
  bool debug{false};
  bool help{false};
};

void print_usage(std::FILE* out) {
  std::fprintf(out,
    "Usage: ransomwatch [options]\n"
    "  -t, --training-duration S   training window in seconds (default 300)\n"
    "  -i, --interval S            detection interval in seconds (default 5)\n"
    "      --contamination F       expected baseline contamination, 0 < F < 0.5 (default 0.1)\n"
    "      --top-n N               suspicious processes per result (default 5)\n"
    "      --config PATH           config file (default $XDG_CONFIG_HOME/ransomwatch/config.toml)\n"
    "      --data-dir DIR          models, history and logs\n"
    "      --watch PATH            directory to monitor; repeatable (default $HOME)\n"
    "      --metrics-port P        serve Prometheus metrics on :P\n"
    "      --load-baseline         use the saved model when compatible, train otherwise\n"
    "      --retrain               always train a fresh model\n"
    "      --cleanup               empty the logs, history, models and training folders first\n"
    "      --validate-model        check the saved model against this host and exit\n"
    "      --iterations N          stop after N detection ticks\n"
    "      --debug                 debug logging\n"
    "  -h, --help                  this text\n"
    "Exit status: 0 clean stop, 1 fatal detector error, 2 bad usage.\n");
}

double parse_number(const std::string& flag, const std::string& v) {
  size_t used = 0;
  double d = 0.0;
  try {
    d = std::stod(v, &used);
  } catch (const std::exception&) {
    throw std::invalid_argument(flag + ": '" + v + "' is not a number");
  }
  if (used != v.size()) throw std::invalid_argument(flag + ": '" + v + "' is not a number");
  return d;
}

int parse_int(const std::string& flag, const std::string& v) {
  double d = parse_number(flag, v);
  if (d != static_cast<double>(static_cast<long long>(d)) || d < -2147483648.0 || d > 2147483647.0)
    throw std::invalid_argument(flag + ": '" + v + "' is not an integer");
  return static_cast<int>(d);
}

// Throws std::invalid_argument on bad usage.
CliOptions parse_args(int argc, char** argv) {
  CliOptions o{};
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto value = [&]() -> std::string {
      if (i + 1 >= argc) throw std::invalid_argument(a + " needs a value");
      return argv[++i];
    };
    if (a == "-t" || a == "--training-duration") o.training_seconds = parse_number(a, value());
    else if (a == "-i" || a == "--interval") o.interval_seconds = parse_number(a, value());
    else if (a == "--contamination") o.contamination = parse_number(a, value());
    else if (a == "--top-n") o.top_n = parse_int(a, value());
    else if (a == "--config") o.config_path = value();
    else if (a == "--data-dir") o.data_dir = value();
    else if (a == "--watch") o.watch.push_back(value());
    else if (a == "--metrics-port") o.metrics_port = parse_int(a, value());
    else if (a == "--load-baseline") o.load_baseline = true;
    else if (a == "--retrain") o.retrain = true;
    else if (a == "--cleanup") o.cleanup = true;
    else if (a == "--validate-model") o.validate_model = true;
    else if (a == "--iterations") {
      int n = parse_int(a, value());
      if (n < 0) throw std::invalid_argument("--iterations must not be negative");
      o.iterations = static_cast<uint64_t>(n);
    }
    else if (a == "--debug") o.debug = true;
    else if (a == "-h" || a == "--help") o.help = true;
    else throw std::invalid_argument("unknown option " + a);
  }
  if (o.training_seconds && !(*o.training_seconds > 0.0)) throw std::invalid_argument("training duration must be positive");
  if (o.interval_seconds && !(*o.interval_seconds > 0.0)) throw std::invalid_argument("interval must be positive");
  if (o.contamination && !(*o.contamination > 0.0 && *o.contamination < 0.5))
    throw std::invalid_argument("contamination must be in (0, 0.5)");
  if (o.validate_model && o.retrain) throw std::invalid_argument("--validate-model and --retrain are exclusive");
  if (o.top_n && *o.top_n < 1) throw std::invalid_argument("--top-n must be at least 1");
  if (o.metrics_port && (*o.metrics_port < 0 || *o.metrics_port > 65535)) throw std::invalid_argument("--metrics-port out of range");
  return o;
}

void apply_cli(ui::AppConfig& c, const CliOptions& o) {
  if (o.training_seconds) c.detector.training_seconds = std::max(1, static_cast<int>(*o.training_seconds + 0.5));
  if (o.interval_seconds) c.detector.interval_seconds = *o.interval_seconds;
  if (o.contamination) c.detector.contamination = *o.contamination;
  if (o.top_n) c.detector.top_n = *o.top_n;
  if (o.data_dir) c.storage.data_dir = *o.data_dir;
  if (!o.watch.empty()) c.monitor.paths = o.watch;
  if (o.metrics_port) c.metrics_port = *o.metrics_port;
  if (o.debug) c.log.level = "debug";
}

void setup_logging(const ui::AppConfig& c) {
  ransomwatch::util::LogLevel lvl = ransomwatch::util::LogLevel::Info;
  if (ransomwatch::util::parse_log_level(c.log.level, lvl)) ransomwatch::util::set_log_level(lvl);
  std::string file = ui::resolve_log_file(c);
  if (file.empty()) return;
  std::error_code ec;
  auto parent = std::filesystem::path(file).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent, ec);
  if (ec) RW_LOG_WARN("main", "cannot create %s: %s", parent.c_str(), ec.message().c_str());
  (void)ransomwatch::util::open_log_file(file);  // failure already reported on stderr
}

// Exit status 0 when the saved model loads, matches this build and
// scores a live tick.
int validate_saved_model(app::Detector& detector, app::FileStorage& storage, const ui::AppConfig& cfg,
                         const app::Thresholds& thresholds) {
  auto loaded = storage.load();
  if (!loaded) {
    std::printf("model check: no usable model at %s\n", storage.model_path().c_str());
    return kExitFatal;
  }
  auto model = std::make_shared<const app::TrainedModel>(std::move(*loaded));
  std::printf("%s\n", ui::render_model_summary(*model).c_str());
  std::optional<ransomwatch::model::FeatureVector> live;
  if (detector.initialize()) live = detector.detect().features;
  auto check = app::validate_model(model, ui::detector_options(cfg).interval, thresholds, live ? &*live : nullptr);
  std::fputs(ui::render_model_check(check).c_str(), stdout);
  return check.ok() ? kExitOk : kExitFatal;
}

} // namespace

int main(int argc, char** argv) {
  CliOptions cli{};
  try {
    cli = parse_args(argc, argv);
  } catch (const std::invalid_argument& e) {
    std::fprintf(stderr, "ransomwatch: %s\n", e.what());
    print_usage(stderr);
    return kExitUsage;
  }
  if (cli.help) { print_usage(stdout); return kExitOk; }
  if (cli.debug) ransomwatch::util::set_log_level(ransomwatch::util::LogLevel::Debug);

  ui::AppConfig cfg = ui::load_config(cli.config_path);
  apply_cli(cfg, cli);
  ui::sanitize(cfg);
  if (cli.cleanup) {
    // before the log file under <data_dir>/logs is opened
    auto rep = app::FileStorage(cfg.storage.data_dir).cleanup();
    std::printf("Cleaned %s: %zu entries removed%s\n", cfg.storage.data_dir.c_str(), rep.removed,
                rep.failed ? ", some could not be removed" : "");
  }
  setup_logging(cfg);
  if (!cfg.source.empty()) RW_LOG_INFO("main", "config loaded from %s", cfg.source.c_str());

  app::ProcessWhitelist whitelist;
  try {
    whitelist = app::ProcessWhitelist(cfg.whitelist);
  } catch (const std::regex_error& e) {
    RW_LOG_ERROR("main", "invalid whitelist pattern: %s", e.what());
    return kExitUsage;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  const auto host = app::HostProfile::discover();
  const auto thresholds = app::derive_thresholds(host, ui::threshold_options(cfg));
  RW_LOG_INFO("main", "host: %d cpus, %s disk %s (reference %.0f MB/s), cpu noise floor %.1f%%",
              host.cpu_count, app::disk_class_name(host.disk_class),
              host.disk_device.empty() ? "-" : host.disk_device.c_str(),
              thresholds.disk_reference_bps / app::kMiB, thresholds.cpu_noise_floor_pct);

  collectors::SystemCollector system;
  collectors::ProcessCollector processes;
  if (!processes.init()) RW_LOG_WARN("main", "process collector unavailable; ranking will be empty");
  collectors::FanotifyAttributor attributor;
  collectors::FanotifyAttributor* attr = nullptr;
  if (cfg.monitor.attribution && attributor.start(cfg.monitor.paths)) attr = &attributor;
  auto files = collectors::make_file_collector(
      collectors::InotifyOptions{.roots = cfg.monitor.paths,
                                 .max_watches = static_cast<size_t>(cfg.monitor.max_watches)},
      attr);

  std::unique_ptr<app::FileStorage> storage;
  if (cfg.storage.enabled) storage = std::make_unique<app::FileStorage>(cfg.storage.data_dir);

  app::SteadyClock clock;
  std::stop_source stop;
  // signal handlers only set g_stop; forward it to the stop token
  std::jthread signal_watch([&stop](std::stop_token st) {
    while (!st.stop_requested()) {
      if (g_stop.load()) { stop.request_stop(); return; }
      std::this_thread::sleep_for(100ms);
    }
  });

  app::ResultBuffers results;
  std::unique_ptr<app::MetricsServer> metrics;
  int rc = kExitOk;
  try {
    app::Detector detector(ui::detector_options(cfg), thresholds,
                           app::DetectorDeps{system, processes, *files, clock, storage.get()},
                           std::move(whitelist));

    if (cli.validate_model) {
      if (!storage) {
        RW_LOG_ERROR("main", "--validate-model needs storage enabled");
        rc = kExitUsage;
      } else {
        rc = validate_saved_model(detector, *storage, cfg, thresholds);
      }
    } else {
      bool loaded = false;
      if (cli.load_baseline && !cli.retrain) {
        loaded = detector.initialize();
        if (!loaded) RW_LOG_INFO("main", "no usable saved model; training a new baseline");
      }
      if (!loaded) {
        std::printf("Training baseline for %d s; keep the system in its normal state...\n", cfg.detector.training_seconds);
        std::fflush(stdout);
        detector.train(std::chrono::seconds(cfg.detector.training_seconds), stop.get_token());
      }
      if (auto m = detector.model()) std::printf("%s\n", ui::render_model_summary(*m).c_str());

      if (cfg.metrics_port > 0) {
        metrics = std::make_unique<app::MetricsServer>(results, static_cast<uint16_t>(cfg.metrics_port));
        metrics->start();
      }

      app::AlertEngine alerts(app::AlertRules{.cooldown = std::chrono::seconds(cfg.alert_cooldown_seconds)});
      detector.run(stop.get_token(), [&](const ransomwatch::model::DetectionResult& r) {
        results.publish(r);
        auto raised = alerts.evaluate(r, clock.now());
        std::fputs(ui::render_status(r, raised, detector.state()).c_str(), stdout);
        std::fflush(stdout);
      }, cli.iterations);
    }
    detector.stop();
  } catch (const app::DetectorStoppedError&) {
    RW_LOG_INFO("main", "stopped");
  } catch (const app::TrainingCancelledError& e) {
    RW_LOG_INFO("main", "interrupted during training (%s)", e.what());
  } catch (const app::InsufficientDataError& e) {
    if (g_stop.load()) {
      RW_LOG_INFO("main", "interrupted during training");
    } else {
      RW_LOG_ERROR("main", "%s; lengthen the training window or shorten the interval", e.what());
      rc = kExitFatal;
    }
  } catch (const app::DetectorError& e) {
    RW_LOG_ERROR("main", "fatal: %s", e.what());
    rc = kExitFatal;
  } catch (const std::invalid_argument& e) {
    RW_LOG_ERROR("main", "invalid configuration: %s", e.what());
    rc = kExitUsage;
  } catch (const std::exception& e) {
    RW_LOG_ERROR("main", "fatal: %s", e.what());
    rc = kExitFatal;
  }

  if (metrics) metrics->stop();
  signal_watch.request_stop();
  attributor.stop();
  processes.shutdown();
  ransomwatch::util::close_log_file();
  return rc;
}
