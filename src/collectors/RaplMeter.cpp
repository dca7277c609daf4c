#include "collectors/RaplMeter.hpp"
#include "collectors/SysfsRead.hpp"
#include "util/AsciiLower.hpp"
#include "util/Procfs.hpp"
#include <algorithm>

namespace rtop::collectors {

using rtop::model::UnavailableReason;
using rtop::model::unavailable;

static constexpr double kMaxWatts = 500.0;

RaplMeter::RaplMeter(std::string domain_dir) : dir_(std::move(domain_dir)) {}

rtop::model::Reading<double> RaplMeter::sample(std::chrono::steady_clock::time_point now) {
  if (dir_.empty()) return unavailable(UnavailableReason::NotPresent, "no RAPL domain");
  auto energy = read_number(dir_ + "/energy_uj");
  if (!energy) return std::unexpected(energy.error());
  if (!max_range_uj_) {
    if (auto r = rtop::util::read_file_u64(dir_ + "/max_energy_range_uj")) max_range_uj_ = *r;
    else max_range_uj_ = 0;
  }
  uint64_t cur = static_cast<uint64_t>(*energy);
  if (!last_uj_) {
    last_uj_ = cur; last_ts_ = now;
    return unavailable(UnavailableReason::NotPresent, "warming up");
  }
  double dt = std::chrono::duration<double>(now - last_ts_).count();
  uint64_t prev = *last_uj_;
  last_uj_ = cur; last_ts_ = now;
  if (dt <= 0.0) return unavailable(UnavailableReason::NotPresent, "warming up");
  uint64_t delta = 0;
  if (cur >= prev) delta = cur - prev;
  else if (*max_range_uj_ > prev) delta = (*max_range_uj_ - prev) + cur; // counter wrapped
  double watts = static_cast<double>(delta) / 1e6 / dt;
  return std::clamp(watts, 0.0, kMaxWatts);
}

static std::string trimmed(const std::string& s) { return std::string(rtop::util::trim(s)); }

std::string find_rapl_package_domain() {
  const std::string base = "/sys/class/powercap";
  auto names = rtop::util::list_dir(base);
  std::sort(names.begin(), names.end());
  for (const auto& n : names) {
    // intel-rapl:0 is the package; intel-rapl:0:N are its subdomains
    if (n.rfind("intel-rapl:", 0) != 0 || n.find(':', 11) != std::string::npos) continue;
    auto dom = rtop::util::read_file_string(base + "/" + n + "/name");
    if (dom && trimmed(*dom).rfind("package", 0) == 0) return base + "/" + n;
  }
  return {};
}

std::string find_rapl_gpu_domain() {
  const std::string base = "/sys/class/powercap";
  auto names = rtop::util::list_dir(base);
  std::sort(names.begin(), names.end());
  for (const auto& n : names) {
    if (n.rfind("intel-rapl:", 0) != 0 || n.find(':', 11) == std::string::npos) continue;
    auto dom = rtop::util::read_file_string(base + "/" + n + "/name");
    if (!dom) continue;
    auto d = trimmed(*dom);
    if (d == "uncore" || d == "gpu") return base + "/" + n;
  }
  return {};
}

} // namespace rtop::collectors
