#include "collectors/IntelGpuCollector.hpp"
#include "collectors/MemoryCollector.hpp"
#include "collectors/SysfsRead.hpp"
#include "collectors/ThermalCollector.hpp"
#include "util/AsciiLower.hpp"
#include "util/Procfs.hpp"
#include <algorithm>
#include <charconv>
#include <sstream>
#include <vector>

namespace rtop::collectors {

using rtop::model::GpuDevice;
using rtop::model::GpuVendor;
using rtop::model::Reading;
using rtop::model::UnavailableReason;
using rtop::model::unavailable;
using Clock = std::chrono::steady_clock;

static constexpr double kUsageEma = 0.6;

std::optional<uint64_t> parse_gem_objects_bytes(const std::string& content) {
  std::optional<uint64_t> best;
  std::istringstream ss(content);
  std::string line;
  while (std::getline(ss, line)) {
    std::istringstream ls(rtop::util::to_lower(line));
    std::vector<std::string> tok;
    for (std::string t; ls >> t;) tok.push_back(std::move(t));
    for (size_t i = 1; i < tok.size(); ++i) {
      if (tok[i].find("bytes") == std::string::npos) continue;
      std::string n;
      for (char c : tok[i - 1]) if (c != ',') n.push_back(c);
      uint64_t v = 0;
      auto [ptr, ec] = std::from_chars(n.data(), n.data() + n.size(), v);
      if (ec == std::errc{} && ptr == n.data() + n.size() && !n.empty()) best = best ? std::max(*best, v) : v;
    }
  }
  return best;
}

static std::string trimmed(const std::string& s) { return std::string(rtop::util::trim(s)); }

IntelGpuCollector::IntelGpuCollector() = default;

void IntelGpuCollector::discover() {
  discovered_ = true;
  const std::string base = "/sys/class/drm";
  auto names = rtop::util::list_dir(base);
  std::sort(names.begin(), names.end());
  for (const auto& n : names) {
    // cardN only; cardN-eDP-1 style connector entries are skipped
    if (n.rfind("card", 0) != 0 || n.find('-') != std::string::npos || n.size() == 4) continue;
    auto vendor = rtop::util::read_file_string(base + "/" + n + "/device/vendor");
    if (!vendor || rtop::util::to_lower(trimmed(*vendor)) != "0x8086") continue;
    Card c;
    c.dir = base + "/" + n;
    std::from_chars(n.data() + 4, n.data() + n.size(), c.index);
    c.name = "Intel Graphics";
    if (auto dev = rtop::util::read_file_string(c.dir + "/device/device")) c.name += " [" + trimmed(*dev) + "]";
    card_ = std::move(c);
    break;
  }
  if (card_) rapl_.emplace(find_rapl_gpu_domain());
}

Reading<double> IntelGpuCollector::usage_busy_percent() const {
  return first_available<double>({
    [&]{ return read_number(card_->dir + "/device/gpu_busy_percent"); },
    [&]{ return read_number(card_->dir + "/gpu_busy_percent"); },
    [&]{ return read_number(card_->dir + "/gt/gt0/busy_percent"); },
  });
}

Reading<double> IntelGpuCollector::usage_rc6(Clock::time_point now) {
  std::vector<std::string> paths{card_->dir + "/power/rc6_residency_ms"};
  for (const auto& gt : rtop::util::list_dir(card_->dir + "/gt"))
    if (gt.rfind("gt", 0) == 0) paths.push_back(card_->dir + "/gt/" + gt + "/rc6_residency_ms");

  std::vector<double> busy;
  std::optional<rtop::model::Unavailable> err;
  bool primed = false;
  for (const auto& p : paths) {
    auto v = read_number(p);
    if (!v) { if (!err || v.error().reason == UnavailableReason::PermissionDenied) err = v.error(); continue; }
    uint64_t cur = static_cast<uint64_t>(*v);
    auto it = rc6_prev_.find(p);
    if (it != rc6_prev_.end()) {
      double dms = std::chrono::duration<double, std::milli>(now - it->second.second).count();
      if (dms > 0.0 && cur >= it->second.first) {
        double idle = static_cast<double>(cur - it->second.first) / dms;
        busy.push_back(std::clamp((1.0 - idle) * 100.0, 0.0, 100.0));
      }
    }
    rc6_prev_[p] = {cur, now};
    primed = true;
  }
  if (!busy.empty()) {
    std::sort(busy.begin(), busy.end());
    size_t m = busy.size() / 2;
    return busy.size() % 2 ? busy[m] : (busy[m - 1] + busy[m]) / 2.0;
  }
  if (primed) return unavailable(UnavailableReason::NotPresent, "warming up");
  if (err) return std::unexpected(*err);
  return unavailable(UnavailableReason::NotPresent);
}

Reading<double> IntelGpuCollector::usage_frequency() const {
  auto estimate = [](const std::string& cur, const std::string& min, const std::string& max) -> Reading<double> {
    auto c = read_number(cur);
    if (!c) return c;
    auto lo = read_number(min);
    if (!lo) return lo;
    auto hi = read_number(max);
    if (!hi) return hi;
    if (*hi <= *lo) return unavailable(UnavailableReason::ReadFailed, "degenerate frequency range");
    return std::clamp((*c - *lo) / (*hi - *lo) * 100.0, 0.0, 100.0);
  };
  const auto& d = card_->dir;
  return first_available<double>({
    [&]{ return estimate(d + "/gt_cur_freq_mhz", d + "/gt_min_freq_mhz", d + "/gt_max_freq_mhz"); },
    [&]{ return estimate(d + "/gt/gt0/rps_cur_freq_mhz", d + "/gt/gt0/rps_min_freq_mhz", d + "/gt/gt0/rps_max_freq_mhz"); },
  });
}

Reading<double> IntelGpuCollector::temp_hwmon() const {
  const std::string hw = card_->dir + "/device/hwmon";
  auto dirs = rtop::util::list_dir(hw);
  if (dirs.empty()) return unavailable(UnavailableReason::NotPresent, hw);
  std::sort(dirs.begin(), dirs.end());
  Reading<double> last = unavailable(UnavailableReason::NotPresent, hw);
  for (const auto& h : dirs) {
    last = read_number(hw + "/" + h + "/temp1_input");
    if (last) return normalize_celsius(*last);
  }
  return last;
}

Reading<double> IntelGpuCollector::temp_thermal_zone() {
  return read_thermal_zones({"x86_pkg_temp", "tcpu", "acpitz", "cpu"});
}

Reading<IntelGpuCollector::Mem> IntelGpuCollector::mem_debugfs() const {
  const std::string path = "/sys/kernel/debug/dri/" + std::to_string(card_->index) + "/i915_gem_objects";
  auto txt = read_text(path);
  if (!txt) return std::unexpected(txt.error());
  auto used = parse_gem_objects_bytes(*txt);
  if (!used) return unavailable(UnavailableReason::ReadFailed, path);
  Mem m; m.used = *used; m.label = "VRAM";
  return m;
}

Reading<IntelGpuCollector::Mem> IntelGpuCollector::mem_shared() {
  auto txt = rtop::util::read_file_string("/proc/meminfo");
  if (!txt) return unavailable(UnavailableReason::ReadFailed, "/proc/meminfo");
  uint64_t shmem = 0;
  if (!meminfo_value(*txt, "Shmem", shmem)) return unavailable(UnavailableReason::NotPresent, "Shmem");
  Mem m; m.used = shmem; m.label = "Shared";
  return m;
}

Reading<GpuDevice> IntelGpuCollector::sample(std::chrono::milliseconds) {
  return sample_at(Clock::now());
}

Reading<GpuDevice> IntelGpuCollector::sample_at(Clock::time_point now) {
  if (!discovered_) discover();
  if (!card_) return unavailable(UnavailableReason::NotPresent, "no Intel DRM card");

  GpuDevice dev{};
  dev.vendor = GpuVendor::Intel;
  dev.name = card_->name;

  dev.usage_pct = first_available<double>({
    [&]{ return usage_busy_percent(); },
    [&]{ return usage_rc6(now); },
    [&]{ return usage_frequency(); },
  });
  if (dev.usage_pct) {
    double u = std::clamp(*dev.usage_pct, 0.0, 100.0);
    usage_ema_ = usage_ema_ ? *usage_ema_ + (u - *usage_ema_) * kUsageEma : u;
    dev.usage_pct = *usage_ema_;
  } else {
    usage_ema_.reset();
  }

  dev.temperature_c = first_available<double>({
    [&]{ return temp_hwmon(); },
    [&]{ return temp_thermal_zone(); },
  });

  auto mem = first_available<Mem>({
    [&]{ return mem_debugfs(); },
    [&]{ return mem_shared(); },
  });
  if (mem) {
    dev.mem_used_bytes = mem->used;
    dev.mem_label = mem->label;
    // Shared budget: what is still available plus what the iGPU already holds
    auto info = rtop::util::read_file_string("/proc/meminfo");
    uint64_t total = 0, avail = 0;
    if (info && meminfo_value(*info, "MemTotal", total) && meminfo_value(*info, "MemAvailable", avail))
      dev.mem_total_bytes = std::max(std::min(avail + mem->used, total), mem->used);
    else
      dev.mem_total_bytes = unavailable(UnavailableReason::NotPresent, "MemTotal");
  } else {
    dev.mem_used_bytes = std::unexpected(mem.error());
    dev.mem_total_bytes = std::unexpected(mem.error());
  }

  if (rapl_) dev.power_w = rapl_->sample(now);
  else dev.power_w = unavailable(UnavailableReason::NotPresent, "no RAPL gpu domain");
  return dev;
}

} // namespace rtop::collectors
