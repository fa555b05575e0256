#include "app/ThresholdPolicy.hpp"
#include "collectors/CpuCollector.hpp"
#include "collectors/MemoryCollector.hpp"
#include "util/Log.hpp"
#include "util/Procfs.hpp"

#include <algorithm>

namespace ransomwatch::app {

const char* disk_class_name(DiskClass c) {
  switch (c) {
    case DiskClass::Hdd:  return "hdd";
    case DiskClass::Ssd:  return "ssd";
    case DiskClass::Nvme: return "nvme";
    case DiskClass::Unknown: break;
  }
  return "unknown";
}

double disk_reference_mbps(DiskClass c) {
  switch (c) {
    case DiskClass::Hdd:  return 150.0;
    case DiskClass::Ssd:  return 500.0;
    case DiskClass::Nvme: return 2000.0;
    case DiskClass::Unknown: break;
  }
  return 200.0;
}

static bool virtual_block_device(const std::string& name) {
  static constexpr const char* kPrefixes[] = {"loop", "ram", "dm-", "md", "zram", "sr", "fd", "nbd"};
  for (const char* p : kPrefixes) if (name.rfind(p, 0) == 0) return true;
  return false;
}

HostProfile HostProfile::discover() {
  HostProfile h{};
  h.cpu_count = ransomwatch::collectors::read_logical_cpu_count();
  ransomwatch::model::MemorySample mem{};
  if (ransomwatch::collectors::MemoryCollector{}.sample(mem)) h.mem_total_kb = mem.total_kb;

  auto rank = [](DiskClass c) {
    switch (c) {
      case DiskClass::Nvme: return 3;
      case DiskClass::Ssd:  return 2;
      case DiskClass::Hdd:  return 1;
      case DiskClass::Unknown: break;
    }
    return 0;
  };
  auto devices = ransomwatch::util::list_dir("/sys/block");
  std::sort(devices.begin(), devices.end());
  for (const auto& dev : devices) {
    if (virtual_block_device(dev)) continue;
    DiskClass c = DiskClass::Unknown;
    if (dev.rfind("nvme", 0) == 0) {
      c = DiskClass::Nvme;
    } else if (auto rot = ransomwatch::util::read_first_line("/sys/block/" + dev + "/queue/rotational")) {
      if (*rot == "0") c = DiskClass::Ssd;
      else if (*rot == "1") c = DiskClass::Hdd;
    }
    if (rank(c) > rank(h.disk_class)) { h.disk_class = c; h.disk_device = dev; }
  }
  RW_LOG_INFO("ThresholdPolicy", "host: %d cpus, %llu MiB memory, disk %s (%s)",
              h.cpu_count, static_cast<unsigned long long>(h.mem_total_kb / 1024),
              h.disk_device.empty() ? "-" : h.disk_device.c_str(), disk_class_name(h.disk_class));
  return h;
}

Thresholds derive_thresholds(const HostProfile& host, const ThresholdOptions& opts) {
  Thresholds t{};
  double ref_mbps = opts.disk_reference_mbps > 0.0 ? opts.disk_reference_mbps : disk_reference_mbps(host.disk_class);
  t.disk_reference_bps = ref_mbps * kMiB;
  t.file_event_reference = opts.file_event_reference > 0.0 ? opts.file_event_reference : 100.0;
  t.high_process_cpu_pct = opts.high_process_cpu_pct > 0.0 ? opts.high_process_cpu_pct : 85.0;
  t.cpu_count = std::max(1, host.cpu_count);
  // a single busy core is noise on a large host, not on a small one
  t.cpu_noise_floor_pct = std::clamp(50.0 / static_cast<double>(t.cpu_count), 2.0, 10.0);
  t.disk_noise_floor_bps = std::max(1.0 * kMiB, 0.005 * t.disk_reference_bps);
  t.file_noise_floor_per_s = 2.0;
  t.score_margin = std::max(0.0, opts.score_margin);
  t.score_std_margin = std::max(0.0, opts.score_std_margin);
  t.range_tolerance = opts.range_tolerance > 0.0 ? opts.range_tolerance : 1.0;
  return t;
}

} // namespace ransomwatch::app
