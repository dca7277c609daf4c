#include "app/TelemetryAggregator.hpp"
#include "collectors/CpuCollector.hpp"
#include "collectors/DiskCollector.hpp"
#include "collectors/GpuCollector.hpp"
#include "collectors/MemoryCollector.hpp"
#include "collectors/NetCollector.hpp"
#include "util/Log.hpp"

namespace rtop::app {

using rtop::model::UnavailableReason;
using rtop::model::unavailable;
using Clock = std::chrono::steady_clock;

TelemetryAggregator::TelemetryAggregator(std::chrono::milliseconds provider_budget) : budget_(provider_budget) {}

TelemetryAggregator TelemetryAggregator::with_system_providers(std::chrono::milliseconds provider_budget) {
  TelemetryAggregator a(provider_budget);
  a.set_cpu(std::make_unique<rtop::collectors::CpuCollector>());
  a.set_memory(std::make_unique<rtop::collectors::MemoryCollector>());
  a.set_network(std::make_unique<rtop::collectors::NetCollector>());
  a.set_disks(std::make_unique<rtop::collectors::DiskCollector>());
  a.set_gpu(std::make_unique<rtop::collectors::GpuCollector>());
  return a;
}

template <class T>
rtop::model::Reading<T> TelemetryAggregator::finish(ProviderSlot<T>* slot, const char* domain,
                                                    Clock::time_point deadline) {
  if (!slot) return unavailable(UnavailableReason::NotPresent, "no provider");
  auto r = slot->finish(deadline);
  if (!r && r.error().reason == UnavailableReason::ReadFailed)
    rtop::util::log_once(std::string(domain) + ":failed", "%s unavailable: %s", domain, r.error().detail.c_str());
  return r;
}

rtop::model::SystemSnapshot TelemetryAggregator::collect(const std::optional<std::string>& active_iface) {
  // All domains sample concurrently against one deadline
  const auto deadline = Clock::now() + budget_;
  if (cpu_) cpu_->start(budget_);
  if (memory_) memory_->start(budget_);
  if (network_) network_->start(budget_);
  if (disks_) disks_->start(budget_);
  if (gpu_) gpu_->start(budget_);

  rtop::model::SystemSnapshot snap{};
  snap.cpu = finish(cpu_.get(), "cpu", deadline);
  snap.memory = finish(memory_.get(), "memory", deadline);
  snap.network = finish(network_.get(), "network", deadline);
  snap.disks = finish(disks_.get(), "disk", deadline);
  snap.gpu = finish(gpu_.get(), "gpu", deadline);
  if (snap.network && active_iface) {
    auto& ifs = snap.network->interfaces;
    for (size_t i = 0; i < ifs.size(); ++i)
      if (ifs[i].name == *active_iface) { snap.network->active_index = i; break; }
  }
  snap.timestamp = Clock::now();
  snap.seq = ++seq_;
  return snap;
}

} // namespace rtop::app
