#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include "app/ProviderSlot.hpp"
#include "collectors/IMetricProvider.hpp"
#include "model/Snapshot.hpp"

namespace rtop::app {

// Runs every registered provider once per collect() and assembles the
// snapshot. Each domain runs on its own worker, so a failing, throwing or
// hung provider only blanks its own field and collect() returns within
// roughly one budget.
class TelemetryAggregator {
public:
  explicit TelemetryAggregator(std::chrono::milliseconds provider_budget = std::chrono::milliseconds(250));

  // Aggregator wired to the real Linux providers.
  static TelemetryAggregator with_system_providers(std::chrono::milliseconds provider_budget);

  void set_cpu(std::unique_ptr<rtop::collectors::IMetricProvider<rtop::model::CpuSnapshot>> p) { cpu_ = make_slot(std::move(p), "cpu"); }
  void set_memory(std::unique_ptr<rtop::collectors::IMetricProvider<rtop::model::MemorySnapshot>> p) { memory_ = make_slot(std::move(p), "memory"); }
  void set_network(std::unique_ptr<rtop::collectors::IMetricProvider<rtop::model::NetSnapshot>> p) { network_ = make_slot(std::move(p), "network"); }
  void set_disks(std::unique_ptr<rtop::collectors::IMetricProvider<rtop::model::DiskSnapshot>> p) { disks_ = make_slot(std::move(p), "disk"); }
  void set_gpu(std::unique_ptr<rtop::collectors::IMetricProvider<rtop::model::GpuSnapshot>> p) { gpu_ = make_slot(std::move(p), "gpu"); }

  // active_iface selects NetSnapshot::active_index by name; an interface
  // that has disappeared leaves it unset.
  rtop::model::SystemSnapshot collect(const std::optional<std::string>& active_iface = std::nullopt);

private:
  template <class T>
  static std::unique_ptr<ProviderSlot<T>> make_slot(std::unique_ptr<rtop::collectors::IMetricProvider<T>> p, const char* domain) {
    if (!p) return nullptr;
    return std::make_unique<ProviderSlot<T>>(std::move(p), domain);
  }

  template <class T>
  rtop::model::Reading<T> finish(ProviderSlot<T>* slot, const char* domain,
                                 std::chrono::steady_clock::time_point deadline);

  std::chrono::milliseconds budget_;
  uint64_t seq_{0};
  std::unique_ptr<ProviderSlot<rtop::model::CpuSnapshot>> cpu_;
  std::unique_ptr<ProviderSlot<rtop::model::MemorySnapshot>> memory_;
  std::unique_ptr<ProviderSlot<rtop::model::NetSnapshot>> network_;
  std::unique_ptr<ProviderSlot<rtop::model::DiskSnapshot>> disks_;
  std::unique_ptr<ProviderSlot<rtop::model::GpuSnapshot>> gpu_;
};

} // namespace rtop::app
