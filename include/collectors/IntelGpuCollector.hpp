#pragma once
#include <chrono>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <unordered_map>
#include "collectors/IMetricProvider.hpp"
#include "collectors/RaplMeter.hpp"
#include "model/Gpu.hpp"

namespace rtop::collectors {

// Try each tier in order and return the first reading. If every tier fails the
// result carries the most telling reason: PermissionDenied beats ReadFailed
// beats NotPresent.
template <class T>
rtop::model::Reading<T> first_available(std::initializer_list<std::function<rtop::model::Reading<T>()>> tiers) {
  auto rank = [](rtop::model::UnavailableReason r) {
    switch (r) {
      case rtop::model::UnavailableReason::PermissionDenied: return 3;
      case rtop::model::UnavailableReason::ReadFailed: return 2;
      case rtop::model::UnavailableReason::Timeout: return 2;
      default: return 1;
    }
  };
  std::optional<rtop::model::Unavailable> worst;
  for (const auto& tier : tiers) {
    auto r = tier();
    if (r) return r;
    if (!worst || rank(r.error().reason) > rank(worst->reason)) worst = r.error();
  }
  if (worst) return std::unexpected(*worst);
  return rtop::model::unavailable(rtop::model::UnavailableReason::NotPresent);
}

// Largest integer immediately followed by a "bytes" token in i915_gem_objects.
std::optional<uint64_t> parse_gem_objects_bytes(const std::string& content);

// Integrated Intel graphics via DRM sysfs, debugfs, thermal zones and
// /proc/meminfo. Every field resolves on its own: usage can be absent while
// temperature and memory are present in the same sample.
class IntelGpuCollector : public IMetricProvider<rtop::model::GpuDevice> {
public:
  IntelGpuCollector();
  rtop::model::Reading<rtop::model::GpuDevice> sample(std::chrono::milliseconds budget) override;
  const char* name() const override { return "gpu-intel"; }

  rtop::model::Reading<rtop::model::GpuDevice> sample_at(std::chrono::steady_clock::time_point now);

private:
  struct Card { std::string dir; int index{}; std::string name; };
  struct Mem { uint64_t used{}; uint64_t total{}; std::string label; };

  bool discovered_{false};
  std::optional<Card> card_{};
  std::unordered_map<std::string, std::pair<uint64_t, std::chrono::steady_clock::time_point>> rc6_prev_{};
  std::optional<double> usage_ema_{};
  std::optional<RaplMeter> rapl_{};

  void discover();

  rtop::model::Reading<double> usage_busy_percent() const;
  rtop::model::Reading<double> usage_rc6(std::chrono::steady_clock::time_point now);
  rtop::model::Reading<double> usage_frequency() const;

  rtop::model::Reading<double> temp_hwmon() const;
  static rtop::model::Reading<double> temp_thermal_zone();

  rtop::model::Reading<Mem> mem_debugfs() const;
  static rtop::model::Reading<Mem> mem_shared();
};

} // namespace rtop::collectors
