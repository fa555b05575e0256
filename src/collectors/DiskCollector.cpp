#include "collectors/DiskCollector.hpp"
#include "util/Procfs.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace ransomwatch::collectors {

static bool is_virtual(const std::string& name) {
  static constexpr const char* kPrefixes[] = {"loop", "ram", "dm-", "md", "zram", "sr", "fd"};
  for (const char* p : kPrefixes) if (name.rfind(p, 0) == 0) return true;
  return false;
}

bool DiskCollector::is_physical(const std::string& name, const std::vector<std::string>& names) {
  if (name.empty() || is_virtual(name)) return false;
  if (!std::isdigit(static_cast<unsigned char>(name.back()))) return true;
  // sda1 -> sda, nvme0n1p2 -> nvme0n1, mmcblk0p1 -> mmcblk0
  std::string base = name;
  while (!base.empty() && std::isdigit(static_cast<unsigned char>(base.back()))) base.pop_back();
  if (base.size() > 1 && base.back() == 'p' && std::isdigit(static_cast<unsigned char>(base[base.size() - 2]))) base.pop_back();
  if (base.empty() || base == name) return true;
  return std::find(names.begin(), names.end(), base) == names.end();
}

bool DiskCollector::sample(ransomwatch::model::DiskCounters& out) const {
  auto txt_opt = ransomwatch::util::read_file_string("/proc/diskstats");
  if (!txt_opt) return false;

  struct Row { std::string name; uint64_t rdsec; uint64_t wrsec; };
  std::vector<Row> rows;
  std::vector<std::string> names;
  std::istringstream ss(*txt_opt); std::string line;
  while (std::getline(ss, line)) {
    std::istringstream ls(line);
    unsigned major = 0, minor = 0; std::string name;
    uint64_t rd = 0, rdmerge = 0, rdsec = 0, rdtm = 0, wr = 0, wrmerge = 0, wrsec = 0;
    if (!(ls >> major >> minor >> name >> rd >> rdmerge >> rdsec >> rdtm >> wr >> wrmerge >> wrsec)) continue;
    names.push_back(name);
    rows.push_back(Row{name, rdsec, wrsec});
  }

  ransomwatch::model::DiskCounters acc{};
  for (const auto& r : rows) {
    if (!is_physical(r.name, names)) continue;
    acc.read_bytes += r.rdsec * kSectorSize;
    acc.write_bytes += r.wrsec * kSectorSize;
    ++acc.devices;
  }
  out = acc;
  return true;
}

} // namespace ransomwatch::collectors
