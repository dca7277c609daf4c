#include "collectors/NvidiaGpuCollector.hpp"
#include "util/NvmlDyn.hpp"

namespace rtop::collectors {

using rtop::model::GpuDevice;
using rtop::model::UnavailableReason;
using rtop::model::unavailable;

rtop::model::Reading<std::vector<GpuDevice>> NvidiaGpuCollector::sample(std::chrono::milliseconds) {
  auto& nvml = rtop::util::NvmlDyn::instance();
  if (!nvml.load_once()) return unavailable(UnavailableReason::NotPresent, nvml.last_error());
  std::vector<GpuDevice> devs;
  if (!nvml.read_devices(devs, 4)) return unavailable(UnavailableReason::NotPresent, "no NVIDIA devices");
  return devs;
}

} // namespace rtop::collectors
