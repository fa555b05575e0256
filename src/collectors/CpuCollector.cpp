#include "collectors/CpuCollector.hpp"
#include "util/Procfs.hpp"

#include <cctype>
#include <charconv>
#include <string>
#include <string_view>

namespace ransomwatch::collectors {

static void parse_cpu_line(std::string_view line, ransomwatch::model::CpuTimes& out) {
  // line starts with 'cpu' or 'cpuN'
  size_t pos = line.find(' ');
  if (pos == std::string_view::npos) return;
  std::string_view rest = line.substr(pos + 1);
  uint64_t vals[8]{}; int i = 0;
  size_t start = 0;
  while (i < 8 && start < rest.size()) {
    while (start < rest.size() && (rest[start] == ' ' || rest[start] == '\t')) ++start;
    size_t end = start;
    while (end < rest.size() && rest[end] >= '0' && rest[end] <= '9') ++end;
    if (end > start) std::from_chars(rest.data() + start, rest.data() + end, vals[i++]);
    start = end + 1;
  }
  out.user = vals[0]; out.nice = vals[1]; out.system = vals[2]; out.idle = vals[3];
  out.iowait = vals[4]; out.irq = vals[5]; out.softirq = vals[6]; out.steal = vals[7];
}

static int count_cpu_lines(const std::string& txt, ransomwatch::model::CpuTimes* agg) {
  int count = 0;
  size_t start = 0; bool after_cpu = false;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start); if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    if (line.starts_with("cpu ")) { if (agg) parse_cpu_line(line, *agg); after_cpu = true; }
    else if (after_cpu && line.size() > 3 && line.starts_with("cpu") && std::isdigit(static_cast<unsigned char>(line[3]))) ++count;
    else if (after_cpu) break;
    start = end + 1;
  }
  return count;
}

int read_logical_cpu_count() {
  auto txt = ransomwatch::util::read_file_string("/proc/stat");
  if (!txt) return 1;
  int n = count_cpu_lines(*txt, nullptr);
  return n > 0 ? n : 1;
}

bool CpuCollector::sample(ransomwatch::model::CpuSample& out) {
  auto txt_opt = ransomwatch::util::read_file_string("/proc/stat");
  if (!txt_opt) return false;
  ransomwatch::model::CpuTimes agg{};
  int cpus = count_cpu_lines(*txt_opt, &agg);
  if (agg.total() == 0) return false;

  double usage = 0.0;
  if (has_last_) {
    auto total = agg.total(), last_total = last_total_.total();
    auto work = agg.work(), last_work = last_total_.work();
    uint64_t td = total > last_total ? total - last_total : 0;
    uint64_t wd = work > last_work ? work - last_work : 0;
    usage = (td > 0) ? (100.0 * static_cast<double>(wd) / static_cast<double>(td)) : 0.0;
    if (usage > 100.0) usage = 100.0;
  }
  last_total_ = agg; has_last_ = true;
  out.total_times = agg;
  out.usage_pct = usage;
  out.logical_cpus = cpus > 0 ? cpus : 1;
  return true;
}

} // namespace ransomwatch::collectors
