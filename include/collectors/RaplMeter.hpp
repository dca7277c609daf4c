#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include "model/Availability.hpp"

namespace rtop::collectors {

// Average power of one RAPL powercap domain from energy_uj deltas.
class RaplMeter {
public:
  // domain_dir e.g. "/sys/class/powercap/intel-rapl:0"
  explicit RaplMeter(std::string domain_dir);

  // Watts since the previous call, clamped to 0..500. The first call only primes.
  rtop::model::Reading<double> sample(std::chrono::steady_clock::time_point now);

  const std::string& domain_dir() const { return dir_; }

private:
  std::string dir_;
  std::optional<uint64_t> last_uj_{};
  std::chrono::steady_clock::time_point last_ts_{};
  std::optional<uint64_t> max_range_uj_{};
};

// Powercap directory of the package domain, or empty if RAPL is absent.
std::string find_rapl_package_domain();

// Subdomain of the package whose name is "uncore" or "gpu" (integrated graphics).
std::string find_rapl_gpu_domain();

} // namespace rtop::collectors
