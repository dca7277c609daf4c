#pragma once
#include <string>
#include "collectors/IProcessCollector.hpp"

namespace rtop::collectors {

// Scans /proc/<pid>/{stat,cmdline}.
class ProcessCollector : public IProcessCollector {
public:
  ProcessCollector();
  bool sample(std::vector<rtop::model::ProcSample>& out) override;
  std::optional<rtop::model::ProcSample> read_one(int32_t pid) override;
  unsigned cpu_count() override;
  double ticks_per_second() const override { return ticks_per_sec_; }
  const char* name() const override { return "/proc scanner"; }

  // Parse one /proc/<pid>/stat line. comm may contain spaces and parentheses.
  static bool parse_stat_line(const std::string& content, long page_size, rtop::model::ProcSample& out);

private:
  double ticks_per_sec_{100.0};
  long page_size_{4096};
  unsigned ncpu_{0};

  static std::string read_cmdline(int32_t pid);
};

} // namespace rtop::collectors
