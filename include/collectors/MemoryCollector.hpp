#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include "collectors/IMetricProvider.hpp"
#include "model/Memory.hpp"

namespace rtop::collectors {

class MemoryCollector : public IMetricProvider<rtop::model::MemorySnapshot> {
public:
  rtop::model::Reading<rtop::model::MemorySnapshot> sample(std::chrono::milliseconds budget) override;
  const char* name() const override { return "memory"; }
};

// Value of one /proc/meminfo key in bytes (the file reports kB).
bool meminfo_value(const std::string& meminfo, std::string_view key, uint64_t& out_bytes);

} // namespace rtop::collectors
