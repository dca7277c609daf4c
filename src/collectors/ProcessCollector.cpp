#include "collectors/ProcessCollector.hpp"
#include "util/Procfs.hpp"
#include <unistd.h>
#include <cctype>
#include <charconv>
#include <sstream>

namespace rtop::collectors {

using rtop::model::ProcSample;

ProcessCollector::ProcessCollector() {
  long hz = ::sysconf(_SC_CLK_TCK);
  if (hz > 0) ticks_per_sec_ = static_cast<double>(hz);
  long ps = ::sysconf(_SC_PAGESIZE);
  if (ps > 0) page_size_ = ps;
}

unsigned ProcessCollector::cpu_count() {
  if (ncpu_ != 0) return ncpu_;
  unsigned count = 0;
  if (auto txt = rtop::util::read_file_string("/proc/stat")) {
    std::istringstream ss(*txt); std::string line;
    while (std::getline(ss, line)) {
      // per-core lines are "cpuN ..."; the aggregate "cpu " line is skipped
      if (line.size() > 3 && line.rfind("cpu", 0) == 0 && std::isdigit(static_cast<unsigned char>(line[3]))) ++count;
    }
  }
  ncpu_ = count ? count : 1;
  return ncpu_;
}

bool ProcessCollector::parse_stat_line(const std::string& content, long page_size, ProcSample& out) {
  auto lp = content.find('('); auto rp = content.rfind(')');
  if (lp == std::string::npos || rp == std::string::npos || rp < lp || rp + 2 > content.size()) return false;
  {
    int32_t pid = 0;
    auto [ptr, ec] = std::from_chars(content.data(), content.data() + lp, pid);
    if (ec != std::errc{}) return false;
    out.pid = pid;
  }
  out.name = content.substr(lp + 1, rp - lp - 1);
  // Fields after comm, counted from 0 at "state": ppid=1, utime=11, stime=12, starttime=19, rss=21
  std::istringstream ss(content.substr(rp + 2));
  std::string tok;
  uint64_t utime = 0, stime = 0;
  int64_t rss_pages = 0;
  int idx = 0;
  while (ss >> tok && idx <= 21) {
    switch (idx) {
      case 0: out.state = tok.empty() ? '?' : tok[0]; break;
      case 1: std::from_chars(tok.data(), tok.data() + tok.size(), out.ppid); break;
      case 11: std::from_chars(tok.data(), tok.data() + tok.size(), utime); break;
      case 12: std::from_chars(tok.data(), tok.data() + tok.size(), stime); break;
      case 19: std::from_chars(tok.data(), tok.data() + tok.size(), out.start_time); break;
      case 21: std::from_chars(tok.data(), tok.data() + tok.size(), rss_pages); break;
      default: break;
    }
    ++idx;
  }
  if (idx < 20) return false;
  out.cpu_ticks = utime + stime;
  out.rss_bytes = rss_pages > 0 ? static_cast<uint64_t>(rss_pages) * static_cast<uint64_t>(page_size) : 0;
  return true;
}

std::string ProcessCollector::read_cmdline(int32_t pid) {
  auto bytes = rtop::util::read_file_bytes("/proc/" + std::to_string(pid) + "/cmdline");
  if (!bytes) return {};
  std::string out; out.reserve(bytes->size()); bool sep = true;
  for (auto b : *bytes) {
    if (b == 0) { if (!sep) { out.push_back(' '); sep = true; } }
    else { out.push_back(static_cast<char>(b)); sep = false; }
  }
  if (!out.empty() && out.back() == ' ') out.pop_back();
  return out;
}

std::optional<ProcSample> ProcessCollector::read_one(int32_t pid) {
  auto content = rtop::util::read_file_string("/proc/" + std::to_string(pid) + "/stat");
  if (!content) return std::nullopt;
  ProcSample ps;
  if (!parse_stat_line(*content, page_size_, ps) || ps.pid != pid) return std::nullopt;
  return ps;
}

bool ProcessCollector::sample(std::vector<ProcSample>& out) {
  out.clear();
  auto names = rtop::util::list_dir("/proc");
  if (names.empty()) return false;
  for (const auto& name : names) {
    if (name.empty() || !std::isdigit(static_cast<unsigned char>(name[0]))) continue;
    int32_t pid = 0;
    auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), pid);
    if (ec != std::errc{} || ptr != name.data() + name.size()) continue;
    // A process can exit between listing and reading; it is simply not part of this sample
    auto ps = read_one(pid);
    if (!ps) continue;
    ps->cmd = read_cmdline(pid);
    out.push_back(std::move(*ps));
  }
  return true;
}

} // namespace rtop::collectors
