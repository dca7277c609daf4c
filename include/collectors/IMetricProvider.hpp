#pragma once
#include <chrono>
#include "model/Availability.hpp"

namespace rtop::collectors {

// One telemetry domain. sample() is called once per sampling tick and must
// return within roughly `budget`; anything it cannot read comes back as
// Unavailable rather than an exception.
template <class Sample>
class IMetricProvider {
public:
  virtual ~IMetricProvider() = default;

  [[nodiscard]] virtual rtop::model::Reading<Sample> sample(std::chrono::milliseconds budget) = 0;

  // Short label for diagnostics
  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace rtop::collectors
