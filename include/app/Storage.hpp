#pragma once
#include "app/TrainedModel.hpp"
#include "model/Detection.hpp"

#include <ctime>
#include <filesystem>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <vector>

namespace ransomwatch::app {

// Persistence collaborator. Everything here is best effort: failures are
// logged, never thrown, and the detector keeps running without it.
class IStorage {
public:
  virtual ~IStorage() = default;
  virtual void save(const TrainedModel& model) = 0;
  // nullopt when no usable model exists (missing, malformed, other schema)
  [[nodiscard]] virtual std::optional<TrainedModel> load() = 0;
  virtual void append(const ransomwatch::model::DetectionResult& result) = 0;
  virtual void save_baseline(const std::vector<ransomwatch::model::FeatureVector>& rows) = 0;
};

// Text model format. read_model throws ModelFormatError.
void write_model(std::ostream& out, const TrainedModel& model);
[[nodiscard]] TrainedModel read_model(std::istream& in);

struct CleanupReport {
  size_t removed{};   // entries deleted under the data folders
  size_t failed{};    // entries that could not be deleted
};

// <data_dir>/logs/ransomwatch_YYYYMMDD.log
// <data_dir>/models/model_latest.txt
// <data_dir>/history/ransomwatch_YYYY-MM-DD_HH.prom   (hourly chunks)
// <data_dir>/training/baseline_YYYYMMDD_HHMMSS.csv
class FileStorage : public IStorage {
public:
  explicit FileStorage(std::filesystem::path data_dir);

  void save(const TrainedModel& model) override;
  std::optional<TrainedModel> load() override;
  void append(const ransomwatch::model::DetectionResult& result) override;
  void save_baseline(const std::vector<ransomwatch::model::FeatureVector>& rows) override;

  // Empties logs/, history/, models/ and training/ and recreates them.
  // Anything else under data_dir is left alone.
  CleanupReport cleanup();

  [[nodiscard]] std::filesystem::path model_path() const { return dir_ / "models" / "model_latest.txt"; }
  [[nodiscard]] std::filesystem::path chunk_path(std::time_t t) const;
  [[nodiscard]] const std::filesystem::path& data_dir() const { return dir_; }

private:
  bool ensure_dir(const std::filesystem::path& p) const;

  std::filesystem::path dir_;
  std::mutex mu_;
};

} // namespace ransomwatch::app
