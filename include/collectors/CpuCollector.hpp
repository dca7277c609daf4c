#pragma once
#include <string>
#include <vector>
#include "collectors/IMetricProvider.hpp"
#include "collectors/RaplMeter.hpp"
#include "collectors/ThermalCollector.hpp"
#include "model/Cpu.hpp"

namespace rtop::collectors {

class CpuCollector : public IMetricProvider<rtop::model::CpuSnapshot> {
public:
  CpuCollector();
  rtop::model::Reading<rtop::model::CpuSnapshot> sample(std::chrono::milliseconds budget) override;
  const char* name() const override { return "cpu"; }

private:
  rtop::model::CpuTimes last_total_{};
  std::vector<rtop::model::CpuTimes> last_per_{};
  bool has_last_{false};
  std::string cpu_model_{};
  bool model_loaded_{false};
  ThermalCollector thermal_{};
  RaplMeter rapl_;
};

// Percent of non-idle time between two /proc/stat samples; 0 if no time passed
// or the counters went backwards.
double busy_pct(const rtop::model::CpuTimes& prev, const rtop::model::CpuTimes& cur);

// /proc/loadavg
rtop::model::Reading<rtop::model::LoadAvg> read_load_avg();

// cpufreq scaling_cur_freq per core, falling back to "cpu MHz" in /proc/cpuinfo.
rtop::model::Reading<std::vector<double>> read_core_frequencies(size_t cores);

// Mean of the non-zero entries; 0 when there are none.
double mean_frequency_mhz(const std::vector<double>& mhz);

} // namespace rtop::collectors
