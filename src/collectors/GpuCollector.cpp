#include "collectors/GpuCollector.hpp"
#include "collectors/IntelGpuCollector.hpp"
#include "collectors/NvidiaGpuCollector.hpp"

namespace rtop::collectors {

using rtop::model::GpuSnapshot;
using rtop::model::UnavailableReason;
using rtop::model::unavailable;

GpuCollector::GpuCollector()
  : GpuCollector(std::make_unique<NvidiaGpuCollector>(), std::make_unique<IntelGpuCollector>()) {}

GpuCollector::GpuCollector(std::unique_ptr<NvidiaSource> nvidia, std::unique_ptr<IntelSource> intel)
  : nvidia_(std::move(nvidia)), intel_(std::move(intel)) {}

rtop::model::Reading<GpuSnapshot> GpuCollector::sample(std::chrono::milliseconds budget) {
  GpuSnapshot out{};
  std::optional<rtop::model::Unavailable> nvidia_reason;
  if (nvidia_) {
    auto nv = nvidia_->sample(budget);
    if (nv) out.devices = std::move(*nv);
    else nvidia_reason = nv.error();
  }
  if (intel_) {
    auto in = intel_->sample(budget);
    if (in) out.devices.push_back(std::move(*in));
  }
  if (out.devices.empty()) {
    if (nvidia_reason) return std::unexpected(*nvidia_reason);
    return unavailable(UnavailableReason::NotPresent, "no GPU");
  }
  return out;
}

} // namespace rtop::collectors
