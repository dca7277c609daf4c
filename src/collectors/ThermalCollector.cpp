#include "collectors/ThermalCollector.hpp"
#include "collectors/SysfsRead.hpp"
#include "util/AsciiLower.hpp"
#include "util/Procfs.hpp"
#include <algorithm>
#include <optional>
#include <string>

namespace rtop::collectors {

using rtop::model::Reading;
using rtop::model::UnavailableReason;
using rtop::model::unavailable;

double normalize_celsius(double raw) { return raw > 1000.0 ? raw / 1000.0 : raw; }

// Prefer the worst failure seen so the operator learns about "No perm".
static void note_failure(std::optional<rtop::model::Unavailable>& worst, const rtop::model::Unavailable& u) {
  if (!worst || u.reason == UnavailableReason::PermissionDenied) worst = u;
}

Reading<double> read_thermal_zones(const std::vector<std::string_view>& type_keys) {
  const std::string base = "/sys/class/thermal";
  std::optional<double> best;
  std::optional<rtop::model::Unavailable> worst;
  for (const auto& z : rtop::util::list_dir(base)) {
    if (z.rfind("thermal_zone", 0) != 0) continue;
    auto type = read_text(base + "/" + z + "/type");
    if (!type) continue;
    auto t = rtop::util::to_lower(rtop::util::trim(*type));
    bool match = std::any_of(type_keys.begin(), type_keys.end(),
                             [&](std::string_view k){ return t.find(k) != std::string::npos; });
    if (!match) continue;
    auto v = read_number(base + "/" + z + "/temp");
    if (!v) { note_failure(worst, v.error()); continue; }
    double c = normalize_celsius(*v);
    if (c <= 0.0) continue;
    if (!best || c > *best) best = c;
  }
  if (best) return *best;
  if (worst) return std::unexpected(*worst);
  return unavailable(UnavailableReason::NotPresent, "no matching thermal zone");
}

Reading<double> ThermalCollector::cpu_package_c() {
  static constexpr std::string_view cpu_chips[] = {"coretemp", "k10temp", "zenpower", "cpu_thermal"};
  const std::string base = "/sys/class/hwmon";
  std::optional<double> best;
  std::optional<rtop::model::Unavailable> worst;
  for (const auto& h : rtop::util::list_dir(base)) {
    auto chip = rtop::util::read_file_string(base + "/" + h + "/name");
    if (!chip) continue;
    auto c = rtop::util::trim(*chip);
    if (std::find(std::begin(cpu_chips), std::end(cpu_chips), c) == std::end(cpu_chips)) continue;
    for (const auto& f : rtop::util::list_dir(base + "/" + h)) {
      if (f.rfind("temp", 0) != 0 || !f.ends_with("_input")) continue;
      auto v = read_number(base + "/" + h + "/" + f);
      if (!v) { note_failure(worst, v.error()); continue; }
      double deg = normalize_celsius(*v);
      if (!best || deg > *best) best = deg;
    }
  }
  if (best) return *best;
  auto tz = read_thermal_zones({"x86_pkg_temp", "cpu", "tcpu", "acpitz"});
  if (tz) return tz;
  if (worst) return std::unexpected(*worst);
  return tz;
}

} // namespace rtop::collectors
