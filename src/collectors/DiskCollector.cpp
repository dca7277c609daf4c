#include "collectors/DiskCollector.hpp"
#include "util/Procfs.hpp"

#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sstream>
#include <unordered_set>

namespace rtop::collectors {

using rtop::model::DiskMount;
using rtop::model::DiskSnapshot;
using rtop::model::UnavailableReason;
using rtop::model::unavailable;

bool is_pseudo_fs(const std::string& fstype) {
  static const std::unordered_set<std::string> bad = {
    "proc","sysfs","devtmpfs","devpts","tmpfs","cgroup","cgroup2","pstore","securityfs",
    "bpf","autofs","mqueue","hugetlbfs","configfs","debugfs","tracefs","nsfs","ramfs",
    "fusectl","fuse.portal","overlay","squashfs","efivarfs","binfmt_misc","rpc_pipefs"
  };
  return bad.count(fstype) != 0;
}

std::string unescape_mount_field(const std::string& s) {
  std::string out; out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\\' && i + 3 < s.size() &&
        s[i+1] >= '0' && s[i+1] <= '7' && s[i+2] >= '0' && s[i+2] <= '7' && s[i+3] >= '0' && s[i+3] <= '7') {
      out.push_back(static_cast<char>((s[i+1]-'0')*64 + (s[i+2]-'0')*8 + (s[i+3]-'0')));
      i += 3;
    } else {
      out.push_back(s[i]);
    }
  }
  return out;
}

rtop::model::Reading<DiskSnapshot> DiskCollector::sample(std::chrono::milliseconds) {
  auto txt = rtop::util::read_file_string("/proc/self/mounts");
  if (!txt) return unavailable(UnavailableReason::ReadFailed, "/proc/self/mounts");

  DiskSnapshot out{};
  std::unordered_set<uint64_t> seen_fs;
  std::istringstream ss(*txt);
  std::string line;
  while (std::getline(ss, line)) {
    if (line.empty()) continue;
    std::istringstream ls(line);
    std::string device, mountpoint, fstype;
    if (!(ls >> device >> mountpoint >> fstype)) continue;
    if (is_pseudo_fs(fstype)) continue;
    mountpoint = unescape_mount_field(mountpoint);

    struct stat st{};
    if (::stat(mountpoint.c_str(), &st) != 0) continue;
    // The filesystem identity is the device id, not the path string
    uint64_t fs_id = static_cast<uint64_t>(st.st_dev);
    if (seen_fs.count(fs_id)) continue;

    struct statvfs vfs{};
    if (statvfs_(mountpoint.c_str(), &vfs) != 0) continue;
    uint64_t total = static_cast<uint64_t>(vfs.f_blocks) * vfs.f_frsize;
    if (total == 0) continue;
    seen_fs.insert(fs_id);
    uint64_t avail = static_cast<uint64_t>(vfs.f_bavail) * vfs.f_frsize;
    uint64_t free_b = static_cast<uint64_t>(vfs.f_bfree) * vfs.f_frsize;

    DiskMount m;
    m.device = device;
    m.mountpoint = mountpoint;
    m.fstype = fstype;
    m.fs_id = fs_id;
    m.total_bytes = total;
    m.avail_bytes = avail;
    m.used_bytes = total > free_b ? total - free_b : 0;
    out.mounts.push_back(std::move(m));
  }
  return out;
}

} // namespace rtop::collectors
