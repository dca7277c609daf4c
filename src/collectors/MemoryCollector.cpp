#include "collectors/MemoryCollector.hpp"
#include "util/Procfs.hpp"

#include <charconv>
#include <string>
#include <string_view>

namespace rtop::collectors {

using rtop::model::MemorySnapshot;
using rtop::model::UnavailableReason;
using rtop::model::unavailable;

static inline uint64_t parse_kb(std::string_view s) {
  while (!s.empty() && (s.back() < '0' || s.back() > '9')) s.remove_suffix(1); // " kB"
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  uint64_t v = 0;
  std::from_chars(s.data(), s.data() + s.size(), v);
  return v;
}

bool meminfo_value(const std::string& txt, std::string_view key, uint64_t& out_bytes) {
  size_t start = 0;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start);
    if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    if (line.starts_with(key) && line.size() > key.size() && line[key.size()] == ':') {
      out_bytes = parse_kb(line.substr(key.size() + 1)) * 1024ull;
      return true;
    }
    start = end + 1;
  }
  return false;
}

rtop::model::Reading<MemorySnapshot> MemoryCollector::sample(std::chrono::milliseconds) {
  auto txt_opt = rtop::util::read_file_string("/proc/meminfo");
  if (!txt_opt) return unavailable(UnavailableReason::ReadFailed, "/proc/meminfo");
  const std::string& txt = *txt_opt;

  uint64_t total = 0, free = 0, avail = 0, buffers = 0, cached = 0, swap_total = 0, swap_free = 0;
  if (!meminfo_value(txt, "MemTotal", total) || total == 0)
    return unavailable(UnavailableReason::ReadFailed, "MemTotal missing");
  meminfo_value(txt, "MemFree", free);
  bool have_avail = meminfo_value(txt, "MemAvailable", avail);
  meminfo_value(txt, "Buffers", buffers);
  meminfo_value(txt, "Cached", cached);
  meminfo_value(txt, "SwapTotal", swap_total);
  meminfo_value(txt, "SwapFree", swap_free);

  MemorySnapshot out{};
  out.total = total;
  // Kernels before 3.14 lack MemAvailable
  if (!have_avail) avail = free + buffers + cached;
  out.available = avail < total ? avail : total;
  out.used = total - out.available;
  out.cached = cached + buffers;
  out.swap_total = swap_total;
  out.swap_used = swap_total > swap_free ? swap_total - swap_free : 0;
  return out;
}

} // namespace rtop::collectors
