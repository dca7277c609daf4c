#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include "collectors/IMetricProvider.hpp"
#include "model/Net.hpp"

namespace rtop::collectors {

class NetCollector : public IMetricProvider<rtop::model::NetSnapshot> {
public:
  rtop::model::Reading<rtop::model::NetSnapshot> sample(std::chrono::milliseconds budget) override;
  const char* name() const override { return "network"; }

  // Same as sample() with an explicit clock, for deterministic rates.
  rtop::model::Reading<rtop::model::NetSnapshot> sample_at(std::chrono::steady_clock::time_point now);

private:
  struct Counters { uint64_t rx{}, tx{}; };
  std::unordered_map<std::string, Counters> last_{};
  std::optional<std::chrono::steady_clock::time_point> last_ts_{};
};

// Bytes moved between two readings of a monotonic counter; 0 if it went backwards.
constexpr uint64_t counter_delta(uint64_t prev, uint64_t cur) { return cur >= prev ? cur - prev : 0; }

// Rate per second for a counter delta, 0 when no time elapsed.
constexpr double counter_rate(uint64_t prev, uint64_t cur, double elapsed_s) {
  return elapsed_s > 0.0 ? static_cast<double>(counter_delta(prev, cur)) / elapsed_s : 0.0;
}

// Loopback and virtual bridges/veths are hidden from the interface list.
bool is_virtual_interface(const std::string& name);

} // namespace rtop::collectors
