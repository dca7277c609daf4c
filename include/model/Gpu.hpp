#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include "model/Availability.hpp"

namespace rtop::model {

enum class GpuVendor { Nvidia, Intel };

[[nodiscard]] constexpr std::string_view vendor_label(GpuVendor v) {
  return v == GpuVendor::Nvidia ? "NVIDIA" : "Intel";
}

struct GpuDevice {
  GpuVendor vendor{GpuVendor::Nvidia};
  std::string name;
  Reading<double> usage_pct{unavailable(UnavailableReason::NotPresent)};
  Reading<double> temperature_c{unavailable(UnavailableReason::NotPresent)};
  Reading<uint64_t> mem_used_bytes{unavailable(UnavailableReason::NotPresent)};
  Reading<uint64_t> mem_total_bytes{unavailable(UnavailableReason::NotPresent)};
  Reading<double> power_w{unavailable(UnavailableReason::NotPresent)};
  std::string mem_label{"VRAM"}; // "Shared" when memory comes from system RAM
};

struct GpuSnapshot {
  std::vector<GpuDevice> devices;
};

} // namespace rtop::model
