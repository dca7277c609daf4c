#include "collectors/CpuCollector.hpp"
#include "util/AsciiLower.hpp"
#include "util/Procfs.hpp"
#include <charconv>
#include <sstream>
#include <string>
#include <string_view>

namespace rtop::collectors {

using rtop::model::CpuSnapshot;
using rtop::model::CpuTimes;
using rtop::model::UnavailableReason;
using rtop::model::unavailable;

static void parse_cpu_line(std::string_view line, CpuTimes& out) {
  auto pos = line.find(' ');
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

double busy_pct(const CpuTimes& prev, const CpuTimes& cur) {
  if (cur.total() <= prev.total() || cur.work() < prev.work()) return 0.0;
  auto td = cur.total() - prev.total();
  auto wd = cur.work() - prev.work();
  double pct = 100.0 * static_cast<double>(wd) / static_cast<double>(td);
  return pct > 100.0 ? 100.0 : pct;
}

static std::string read_cpu_model() {
  auto txt = rtop::util::read_file_string("/proc/cpuinfo");
  if (!txt) return {};
  std::istringstream ss(*txt);
  std::string line;
  while (std::getline(ss, line)) {
    // x86 first, then the ARM spellings
    if (line.rfind("model name", 0) == 0 || line.rfind("Hardware", 0) == 0 || line.rfind("Processor", 0) == 0) {
      auto colon = line.find(':');
      if (colon != std::string::npos) return std::string(rtop::util::trim(std::string_view(line).substr(colon + 1)));
    }
  }
  return {};
}

rtop::model::Reading<rtop::model::LoadAvg> read_load_avg() {
  auto txt = rtop::util::read_file_string("/proc/loadavg");
  if (!txt) return unavailable(UnavailableReason::ReadFailed, "/proc/loadavg");
  rtop::model::LoadAvg la{};
  std::istringstream ss(*txt);
  if (!(ss >> la.one >> la.five >> la.fifteen))
    return unavailable(UnavailableReason::ReadFailed, "/proc/loadavg malformed");
  return la;
}

// "cpu MHz : 2400.000" lines in processor order
static std::vector<double> cpuinfo_mhz() {
  std::vector<double> out;
  auto txt = rtop::util::read_file_string("/proc/cpuinfo");
  if (!txt) return out;
  std::istringstream ss(*txt);
  std::string line;
  while (std::getline(ss, line)) {
    if (line.rfind("cpu MHz", 0) != 0) continue;
    auto colon = line.find(':');
    if (colon == std::string::npos) continue;
    try { out.push_back(std::stod(line.substr(colon + 1))); }
    catch (const std::exception&) { out.push_back(0.0); }
  }
  return out;
}

rtop::model::Reading<std::vector<double>> read_core_frequencies(size_t cores) {
  std::vector<double> mhz(cores, 0.0);
  std::vector<double> fallback;
  bool fallback_loaded = false;
  bool any = false;
  for (size_t i = 0; i < cores; ++i) {
    auto khz = rtop::util::read_file_u64("/sys/devices/system/cpu/cpu" + std::to_string(i) + "/cpufreq/scaling_cur_freq");
    if (khz && *khz > 0) {
      mhz[i] = static_cast<double>(*khz) / 1000.0;
    } else {
      if (!fallback_loaded) { fallback = cpuinfo_mhz(); fallback_loaded = true; }
      if (i < fallback.size()) mhz[i] = fallback[i];
    }
    if (mhz[i] > 0.0) any = true;
  }
  if (!any) return unavailable(UnavailableReason::NotPresent, "no cpufreq");
  return mhz;
}

double mean_frequency_mhz(const std::vector<double>& mhz) {
  double sum = 0.0; int n = 0;
  for (double v : mhz) if (v > 0.0) { sum += v; ++n; }
  return n ? sum / n : 0.0;
}

CpuCollector::CpuCollector() : rapl_(find_rapl_package_domain()) {}

rtop::model::Reading<CpuSnapshot> CpuCollector::sample(std::chrono::milliseconds) {
  if (!model_loaded_) { cpu_model_ = read_cpu_model(); model_loaded_ = true; }

  auto txt_opt = rtop::util::read_file_string("/proc/stat");
  if (!txt_opt) return unavailable(UnavailableReason::ReadFailed, "/proc/stat");
  const std::string& txt = *txt_opt;
  CpuTimes agg{}; std::vector<CpuTimes> per;
  bool have_agg = false;
  size_t start = 0;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start); if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    if (line.starts_with("cpu ")) { parse_cpu_line(line, agg); have_agg = true; }
    else if (have_agg && line.starts_with("cpu")) { CpuTimes t{}; parse_cpu_line(line, t); per.push_back(t); }
    else if (have_agg) break;
    start = end + 1;
  }
  if (!have_agg) return unavailable(UnavailableReason::ReadFailed, "/proc/stat has no cpu line");

  CpuSnapshot out{};
  out.per_core_pct.assign(per.size(), 0.0);
  if (has_last_) {
    out.usage_pct = busy_pct(last_total_, agg);
    for (size_t i = 0; i < per.size() && i < last_per_.size(); ++i) out.per_core_pct[i] = busy_pct(last_per_[i], per[i]);
  }
  last_total_ = agg; last_per_ = std::move(per); has_last_ = true;
  out.model = cpu_model_;
  out.logical_threads = static_cast<int>(out.per_core_pct.size());
  if (out.logical_threads <= 0) out.logical_threads = 1;
  out.temperature_c = thermal_.cpu_package_c();
  out.power_w = rapl_.sample(std::chrono::steady_clock::now());
  out.load_avg = read_load_avg();
  out.core_freq_mhz = read_core_frequencies(out.per_core_pct.size());
  return out;
}

} // namespace rtop::collectors
