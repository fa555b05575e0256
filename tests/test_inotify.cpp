#include "minitest.hpp"
#include "app/Errors.hpp"
#include "collectors/InotifyFileCollector.hpp"

#include <filesystem>
#include <fstream>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace ransomwatch::collectors;
using ransomwatch::model::FileActivityBatch;
using ransomwatch::model::FileEventKind;

static fs::path make_watch_root(const char* tag) {
  auto root = fs::temp_directory_path() / fs::path(std::string("ransomwatch_test_inotify_") + tag) / fs::path(std::to_string(::getpid()));
  fs::remove_all(root);
  fs::create_directories(root);
  return root;
}

// Drains batches until `want` events were counted or two seconds passed.
static FileActivityBatch drain(IFileActivityCollector& c, uint64_t want) {
  FileActivityBatch acc{};
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (acc.total() < want && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    auto b = c.sample();
    for (size_t k = 0; k < acc.counts.size(); ++k) acc.counts[k] += b.counts[k];
    acc.dropped += b.dropped;
    acc.overflowed = acc.overflowed || b.overflowed;
    for (auto& ev : b.events) acc.events.push_back(std::move(ev));
  }
  return acc;
}

TEST(inotify_reports_create_modify_rename_delete) {
  auto root = make_watch_root("basic");
  InotifyFileCollector c(InotifyOptions{.roots = {root.string()}});
  c.start();
  ASSERT_EQ(c.watch_count(), 1u);

  {
    std::ofstream f(root / "report.docx");
    f << "quarterly numbers";
  }
  fs::rename(root / "report.docx", root / "report.docx.locked");
  fs::remove(root / "report.docx.locked");

  auto b = drain(c, 1000);  // full window: modify may split across batches
  ASSERT_TRUE(b.count(FileEventKind::Created) >= 1);
  ASSERT_TRUE(b.count(FileEventKind::Modified) >= 1);
  ASSERT_EQ(b.count(FileEventKind::Renamed), 1u);
  ASSERT_EQ(b.count(FileEventKind::Deleted), 1u);
  bool saw_rename = false;
  for (const auto& ev : b.events) {
    if (ev.kind != FileEventKind::Renamed) continue;
    saw_rename = true;
    ASSERT_EQ(ev.old_path, (root / "report.docx").string());
    ASSERT_EQ(ev.path, (root / "report.docx.locked").string());
  }
  ASSERT_TRUE(saw_rename);
  c.stop();
}

TEST(inotify_watches_new_directories) {
  auto root = make_watch_root("subdir");
  InotifyFileCollector c(InotifyOptions{.roots = {root.string()}});
  c.start();
  fs::create_directories(root / "photos");
  (void)drain(c, 1);
  ASSERT_EQ(c.watch_count(), 2u);
  std::ofstream(root / "photos" / "img.jpg") << "x";
  auto b = drain(c, 1);
  ASSERT_TRUE(b.count(FileEventKind::Created) >= 1);
}

TEST(inotify_counts_stay_exact_beyond_event_cap) {
  auto root = make_watch_root("cap");
  InotifyFileCollector c(InotifyOptions{.roots = {root.string()}, .max_watches = 16, .max_events = 5});
  c.start();
  for (int i = 0; i < 20; ++i) {
    std::ofstream f(root / ("f" + std::to_string(i)));
  }
  auto b = drain(c, 40);
  ASSERT_TRUE(b.count(FileEventKind::Created) >= 20);
  ASSERT_TRUE(b.dropped > 0);
}

TEST(inotify_unavailable_root) {
  InotifyFileCollector c(InotifyOptions{.roots = {"/nonexistent/ransomwatch/root"}});
  ASSERT_THROWS(c.start(), ransomwatch::app::CollectorUnavailable);
  auto fallback = make_file_collector(InotifyOptions{.roots = {"/nonexistent/ransomwatch/root"}}, nullptr);
  ASSERT_EQ(std::string(fallback->name()), std::string("unavailable"));
  auto b = fallback->sample();
  ASSERT_TRUE(!b.available);
  ASSERT_EQ(b.total(), 0u);
}

TEST(inotify_batches_unavailable_after_root_removed) {
  auto root = make_watch_root("gone");
  InotifyFileCollector c(InotifyOptions{.roots = {root.string()}});
  c.start();
  ASSERT_TRUE(c.sample().available);
  fs::remove_all(root);
  bool unavailable = false;
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (!unavailable && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    unavailable = !c.sample().available;
  }
  ASSERT_TRUE(unavailable);
  ASSERT_EQ(c.watch_count(), 0u);
}
