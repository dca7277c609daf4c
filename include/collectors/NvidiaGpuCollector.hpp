#pragma once
#include <vector>
#include "collectors/IMetricProvider.hpp"
#include "model/Gpu.hpp"

namespace rtop::collectors {

// NVML is the only NVIDIA source: if it cannot be loaded the domain is absent.
class NvidiaGpuCollector : public IMetricProvider<std::vector<rtop::model::GpuDevice>> {
public:
  rtop::model::Reading<std::vector<rtop::model::GpuDevice>> sample(std::chrono::milliseconds budget) override;
  const char* name() const override { return "gpu-nvidia"; }
};

} // namespace rtop::collectors
