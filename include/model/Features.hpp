#pragma once
#include <array>
#include <cstddef>

namespace ransomwatch::model {

// Feature schema shared by training and scoring. Changing the order or
// count requires bumping kFeatureSchemaVersion; persisted models with a
// different version are rejected on load.
inline constexpr int kFeatureSchemaVersion = 1;
inline constexpr size_t kFeatureCount = 10;

enum FeatureIndex : size_t {
  kCpuUsage = 0,
  kMemoryUsage,
  kDiskReadRate,
  kDiskWriteRate,
  kFilesCreatedRate,
  kFilesModifiedRate,
  kFilesDeletedRate,
  kFilesRenamedRate,
  kHighCpuProcesses,
  kTopProcessIoRate,
};

inline constexpr std::array<const char*, kFeatureCount> kFeatureNames{
  "cpu_usage",
  "memory_usage",
  "disk_read_rate",
  "disk_write_rate",
  "files_created_rate",
  "files_modified_rate",
  "files_deleted_rate",
  "files_renamed_rate",
  "high_cpu_processes",
  "top_process_io_rate",
};

// Features that reflect activity (as opposed to occupancy); used for
// the near-idle noise suppression.
inline constexpr std::array<size_t, 8> kActivityFeatures{
  kCpuUsage, kDiskReadRate, kDiskWriteRate,
  kFilesCreatedRate, kFilesModifiedRate, kFilesDeletedRate, kFilesRenamedRate,
  kTopProcessIoRate,
};

using FeatureVector = std::array<double, kFeatureCount>;

} // namespace ransomwatch::model
