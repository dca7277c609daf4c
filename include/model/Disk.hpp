#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace rtop::model {

struct DiskMount {
  std::string device;      // e.g., /dev/nvme0n1p2
  std::string mountpoint;  // first mount point seen for this filesystem
  std::string fstype;
  uint64_t fs_id{};        // st_dev of the mount point; dedup key
  uint64_t total_bytes{};
  uint64_t used_bytes{};
  uint64_t avail_bytes{};

  double used_pct() const { return total_bytes ? 100.0 * static_cast<double>(used_bytes) / static_cast<double>(total_bytes) : 0.0; }
};

struct DiskSnapshot {
  std::vector<DiskMount> mounts; // one per filesystem, in mount-table order
};

} // namespace rtop::model
