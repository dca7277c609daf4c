#pragma once
#include <memory>
#include <vector>
#include "collectors/IMetricProvider.hpp"
#include "model/Gpu.hpp"

namespace rtop::collectors {

using NvidiaSource = IMetricProvider<std::vector<rtop::model::GpuDevice>>;
using IntelSource = IMetricProvider<rtop::model::GpuDevice>;

// All GPUs from every vendor path. The domain is absent only when no vendor
// reports a device.
class GpuCollector : public IMetricProvider<rtop::model::GpuSnapshot> {
public:
  GpuCollector();
  GpuCollector(std::unique_ptr<NvidiaSource> nvidia, std::unique_ptr<IntelSource> intel);
  rtop::model::Reading<rtop::model::GpuSnapshot> sample(std::chrono::milliseconds budget) override;
  const char* name() const override { return "gpu"; }

private:
  std::unique_ptr<NvidiaSource> nvidia_;
  std::unique_ptr<IntelSource> intel_;
};

} // namespace rtop::collectors
