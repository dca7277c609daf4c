#pragma once
#include <cstdint>
#include <optional>
#include <vector>
#include "model/Process.hpp"

namespace rtop::collectors {

// Source of raw per-process samples. The /proc scanner is the real one;
// tests substitute scripted sources.
class IProcessCollector {
public:
  virtual ~IProcessCollector() = default;

  // Initialize collector. Return false if unavailable (permissions, platform).
  [[nodiscard]] virtual bool init() { return true; }

  // Every process currently visible. Return false if the table could not be read at all.
  [[nodiscard]] virtual bool sample(std::vector<rtop::model::ProcSample>& out) = 0;

  // Re-read a single pid; nullopt if it no longer exists.
  [[nodiscard]] virtual std::optional<rtop::model::ProcSample> read_one(int32_t pid) = 0;

  // Logical CPUs, for normalizing CPU%.
  [[nodiscard]] virtual unsigned cpu_count() = 0;

  // Units of ProcSample::cpu_ticks per second.
  [[nodiscard]] virtual double ticks_per_second() const = 0;

  virtual void shutdown() {}

  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace rtop::collectors
