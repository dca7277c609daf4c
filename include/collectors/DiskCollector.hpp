#pragma once
#include <functional>
#include <string>
#include <sys/statvfs.h>
#include "collectors/IMetricProvider.hpp"
#include "model/Disk.hpp"

namespace rtop::collectors {

// Mounted filesystems with capacity, one row per filesystem. Bind mounts and
// repeated mounts of the same device collapse onto the first mount point whose
// capacity could be read.
class DiskCollector : public IMetricProvider<rtop::model::DiskSnapshot> {
public:
  using StatvfsFn = std::function<int(const char*, struct statvfs*)>;

  DiskCollector() = default;
  explicit DiskCollector(StatvfsFn statvfs_fn) : statvfs_(std::move(statvfs_fn)) {}

  rtop::model::Reading<rtop::model::DiskSnapshot> sample(std::chrono::milliseconds budget) override;
  const char* name() const override { return "disk"; }

private:
  StatvfsFn statvfs_{[](const char* p, struct statvfs* v) { return ::statvfs(p, v); }};
};

bool is_pseudo_fs(const std::string& fstype);

// Decode the octal escapes (\040 for space) used in /proc/self/mounts.
std::string unescape_mount_field(const std::string& s);

} // namespace rtop::collectors
