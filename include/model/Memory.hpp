#pragma once
#include <cstdint>

namespace rtop::model {

// All values in bytes.
struct MemorySnapshot {
  uint64_t total{};
  uint64_t used{};      // total - available
  uint64_t cached{};    // Cached + Buffers
  uint64_t available{};
  uint64_t swap_total{};
  uint64_t swap_used{};

  double used_pct() const { return total ? 100.0 * static_cast<double>(used) / static_cast<double>(total) : 0.0; }
  double swap_pct() const { return swap_total ? 100.0 * static_cast<double>(swap_used) / static_cast<double>(swap_total) : 0.0; }
};

} // namespace rtop::model
