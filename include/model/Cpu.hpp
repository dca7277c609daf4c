#pragma once
#include <cstdint>
#include <vector>
#include <string>
#include "model/Availability.hpp"

namespace rtop::model {

struct CpuTimes {
  uint64_t user{}, nice{}, system{}, idle{}, iowait{}, irq{}, softirq{}, steal{};
  uint64_t total() const { return user + nice + system + idle + iowait + irq + softirq + steal; }
  uint64_t work()  const { return user + nice + system + irq + softirq + steal; }
};

struct LoadAvg {
  double one{}, five{}, fifteen{};
};

struct CpuSnapshot {
  double usage_pct{};               // aggregate percent 0..100
  std::vector<double> per_core_pct;
  std::string model;                // CPU model name (static)
  int logical_threads{0};
  Reading<double> temperature_c{unavailable(UnavailableReason::NotPresent)};
  Reading<double> power_w{unavailable(UnavailableReason::NotPresent)}; // package, from RAPL
  Reading<LoadAvg> load_avg{unavailable(UnavailableReason::NotPresent)};
  // Current clock per logical CPU in MHz; 0 where a core has no reading
  Reading<std::vector<double>> core_freq_mhz{unavailable(UnavailableReason::NotPresent)};
};

} // namespace rtop::model
