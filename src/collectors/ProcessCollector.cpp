#include "collectors/ProcessCollector.hpp"
#include "collectors/CpuCollector.hpp"
#include "util/Procfs.hpp"

#include <unistd.h>

#include <algorithm>
#include <charconv>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace ransomwatch::collectors {

ProcessCollector::ProcessCollector(size_t max_procs) : max_procs_(max_procs) {}

static uint64_t read_cpu_total() {
  auto txt = ransomwatch::util::read_file_string("/proc/stat"); if (!txt) return 0;
  std::istringstream ss(*txt); std::string line; if (!std::getline(ss, line)) return 0;
  size_t pos = line.find(' '); if (pos == std::string::npos) return 0;
  std::string_view rest(line.c_str() + pos + 1);
  uint64_t vals[8]{}; int i = 0; size_t start = 0;
  while (i < 8 && start < rest.size()) {
    while (start < rest.size() && (rest[start] == ' ' || rest[start] == '\t')) ++start;
    size_t end = start; while (end < rest.size() && rest[end] >= '0' && rest[end] <= '9') ++end;
    if (end > start) { std::from_chars(rest.data() + start, rest.data() + end, vals[i++]); }
    start = end + 1;
  }
  uint64_t total = 0; for (int j = 0; j < 8; ++j) total += vals[j]; return total;
}

bool ProcessCollector::parse_stat_line(const std::string& content, uint64_t& utime, uint64_t& stime,
                                       int64_t& rss_pages, std::string& comm) {
  // comm may contain spaces and parentheses; it ends at the last ')'
  auto lp = content.find('('); auto rp = content.rfind(')');
  if (lp == std::string::npos || rp == std::string::npos || rp < lp || rp + 2 > content.size()) return false;
  comm = content.substr(lp + 1, rp - lp - 1);
  std::istringstream ss(content.substr(rp + 2));
  std::string tmp;
  // state, ppid, pgrp, session, tty_nr, tpgid, flags, minflt, cminflt, majflt, cmajflt
  for (int i = 0; i < 11; i++) ss >> tmp;
  ss >> utime >> stime;
  // cutime, cstime, priority, nice, num_threads, itrealvalue, starttime, vsize
  for (int i = 0; i < 8; i++) ss >> tmp;
  ss >> rss_pages;
  return !ss.fail();
}

bool ProcessCollector::parse_io(const std::string& content, uint64_t& read_bytes, uint64_t& write_bytes) {
  bool have_r = false, have_w = false;
  std::istringstream ss(content); std::string line;
  while (std::getline(ss, line)) {
    if (line.rfind("read_bytes:", 0) == 0) { read_bytes = std::strtoull(line.c_str() + 11, nullptr, 10); have_r = true; }
    else if (line.rfind("write_bytes:", 0) == 0) { write_bytes = std::strtoull(line.c_str() + 12, nullptr, 10); have_w = true; }
  }
  return have_r && have_w;
}

static std::string user_name_cached(uint32_t uid) {
  static std::unordered_map<uint32_t, std::string> cache;
  auto it = cache.find(uid);
  if (it != cache.end()) return it->second;
  std::ifstream pw("/etc/passwd"); std::string pl;
  while (std::getline(pw, pl)) {
    auto c1 = pl.find(':'); if (c1 == std::string::npos) continue;
    auto c2 = pl.find(':', c1 + 1); if (c2 == std::string::npos) continue;
    uint32_t fuid = std::strtoul(pl.c_str() + c2 + 1, nullptr, 10);
    if (fuid == uid) {
      std::string name = pl.substr(0, c1);
      cache.emplace(uid, name);
      return name;
    }
  }
  auto fallback = std::to_string(uid);
  cache.emplace(uid, fallback);
  return fallback;
}

std::string ProcessCollector::user_from_status(int32_t pid) {
  auto txt = ransomwatch::util::read_file_string("/proc/" + std::to_string(pid) + "/status");
  if (!txt) return {};
  std::istringstream ss(*txt); std::string line;
  while (std::getline(ss, line)) {
    if (line.rfind("Uid:", 0) == 0) {
      std::istringstream ls(line.substr(4));
      uint32_t uid = 0;
      if (ls >> uid) return user_name_cached(uid);
      return {};
    }
  }
  return {};
}

ransomwatch::model::ProcessSnapshot ProcessCollector::sample() {
  ransomwatch::model::ProcessSnapshot out{};
  auto now = std::chrono::steady_clock::now();
  double wall_dt = have_last_ ? std::chrono::duration<double>(now - last_run_).count() : 0.0;
  uint64_t cpu_total = read_cpu_total();
  if (ncpu_ == 0) ncpu_ = static_cast<unsigned>(read_logical_cpu_count());
  uint64_t cpu_dt = (cpu_total > last_cpu_total_) ? (cpu_total - last_cpu_total_) : 0;

  std::unordered_map<int32_t, Prev> next;
  const long page_kb = ::getpagesize() / 1024;
  for (auto& name : ransomwatch::util::list_dir("/proc")) {
    if (name.empty() || name[0] < '0' || name[0] > '9') continue;
    int32_t pid = static_cast<int32_t>(std::strtol(name.c_str(), nullptr, 10));
    const std::string base = "/proc/" + name;
    auto stat = ransomwatch::util::read_file_string(base + "/stat");
    uint64_t ut = 0, st = 0; int64_t rssp = 0; std::string comm;
    if (!stat || !parse_stat_line(*stat, ut, st, rssp, comm)) { ++out.vanished; continue; }

    ransomwatch::model::ProcessInfo p{};
    p.pid = pid; p.name = comm;
    p.rss_kb = rssp > 0 ? static_cast<uint64_t>(rssp) * static_cast<uint64_t>(page_kb) : 0;
    Prev cur{ut + st, 0, false};
    auto prev = last_.find(pid);
    if (have_last_ && cpu_dt > 0) {
      uint64_t lastp = (prev == last_.end()) ? cur.cpu_time : prev->second.cpu_time;
      uint64_t dp = cur.cpu_time > lastp ? cur.cpu_time - lastp : 0;
      p.cpu_pct = 100.0 * static_cast<double>(dp) / static_cast<double>(cpu_dt) * static_cast<double>(ncpu_);
    }
    // /proc/<pid>/io needs ptrace access; unreadable for other users' processes without root
    if (auto io = ransomwatch::util::read_file_string(base + "/io")) {
      uint64_t rb = 0, wb = 0;
      if (parse_io(*io, rb, wb)) {
        cur.io_bytes = rb + wb; cur.has_io = true;
        p.has_io = true;
        if (have_last_ && wall_dt > 0.0 && prev != last_.end() && prev->second.has_io) {
          uint64_t d = cur.io_bytes > prev->second.io_bytes ? cur.io_bytes - prev->second.io_bytes : 0;
          p.io_bps = static_cast<double>(d) / wall_dt;
        }
      }
    }
    next.emplace(pid, cur);
    out.processes.push_back(std::move(p));
  }
  out.total_processes = out.processes.size();

  auto busier = [](const auto& a, const auto& b) {
    if (a.cpu_pct != b.cpu_pct) return a.cpu_pct > b.cpu_pct;
    if (a.io_bps != b.io_bps) return a.io_bps > b.io_bps;
    return a.pid < b.pid;
  };
  if (out.processes.size() > max_procs_) {
    auto nth = out.processes.begin() + static_cast<std::ptrdiff_t>(max_procs_);
    std::nth_element(out.processes.begin(), nth, out.processes.end(), busier);
    out.processes.resize(max_procs_);
  }
  std::sort(out.processes.begin(), out.processes.end(), busier);
  // owner lookup only for the processes that are actually busy
  for (auto& p : out.processes) {
    if (p.cpu_pct <= 0.0 && p.io_bps <= 0.0) break;
    p.user = user_from_status(p.pid);
  }

  // previous counters only for pids seen in this scan
  last_ = std::move(next);
  last_cpu_total_ = cpu_total; last_run_ = now; have_last_ = true;
  return out;
}

} // namespace ransomwatch::collectors
