#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ransomwatch::model {

enum class FileEventKind : uint8_t { Created = 0, Modified = 1, Deleted = 2, Renamed = 3 };
inline constexpr size_t kFileEventKinds = 4;

struct FileActivity {
  FileEventKind kind{FileEventKind::Modified};
  std::string path;
  std::string old_path;          // Renamed only
  int64_t size{-1};              // -1 when unknown
  int64_t timestamp_ms{};
  std::optional<int32_t> pid;    // nullopt when attribution failed
};

// Events drained from a file-activity backend for one tick window.
// counts are exact even when events were capped.
struct FileActivityBatch {
  std::vector<FileActivity> events;
  std::array<uint64_t, kFileEventKinds> counts{};
  uint64_t dropped{};
  bool overflowed{false};
  bool available{true};

  uint64_t count(FileEventKind k) const { return counts[static_cast<size_t>(k)]; }
  uint64_t total() const { return counts[0] + counts[1] + counts[2] + counts[3]; }

  void add(FileActivity ev, size_t max_events) {
    ++counts[static_cast<size_t>(ev.kind)];
    if (events.size() < max_events) events.push_back(std::move(ev));
    else ++dropped;
  }
};

inline const char* file_event_kind_name(FileEventKind k) {
  switch (k) {
    case FileEventKind::Created:  return "created";
    case FileEventKind::Modified: return "modified";
    case FileEventKind::Deleted:  return "deleted";
    case FileEventKind::Renamed:  return "renamed";
  }
  return "unknown";
}

} // namespace ransomwatch::model
