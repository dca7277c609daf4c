#pragma once
#include <chrono>
#include "model/Availability.hpp"
#include "model/Cpu.hpp"
#include "model/Memory.hpp"
#include "model/Net.hpp"
#include "model/Disk.hpp"
#include "model/Gpu.hpp"

namespace rtop::model {

// Aggregated telemetry for one tick. Replaced by value every sample.
struct SystemSnapshot {
  Reading<CpuSnapshot> cpu{unavailable(UnavailableReason::NotPresent)};
  Reading<MemorySnapshot> memory{unavailable(UnavailableReason::NotPresent)};
  Reading<NetSnapshot> network{unavailable(UnavailableReason::NotPresent)};
  Reading<DiskSnapshot> disks{unavailable(UnavailableReason::NotPresent)};
  Reading<GpuSnapshot> gpu{unavailable(UnavailableReason::NotPresent)};
  std::chrono::steady_clock::time_point timestamp{};
  uint64_t seq{}; // sample counter, starts at 1
};

} // namespace rtop::model
