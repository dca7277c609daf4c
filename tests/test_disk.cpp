#include "minitest.hpp"
#include "collectors/DiskCollector.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

static fs::path make_root_disk() {
  auto root = fs::temp_directory_path() / fs::path("rtop_test_disk_") / fs::path(std::to_string(::getpid()));
  fs::create_directories(root / "proc/self");
  return root;
}

TEST(disk_collector_dedups_same_filesystem) {
  auto root = make_root_disk();
  auto a = root / "data";
  auto b = root / "data/nested";
  fs::create_directories(b);
  // Two mount entries that resolve to the same filesystem, plus pseudo filesystems
  std::ofstream(root / "proc/self/mounts") <<
    "proc /proc proc rw,nosuid 0 0\n"
    "tmpfs /run tmpfs rw 0 0\n"
    "/dev/sda1 " << a.string() << " ext4 rw,relatime 0 0\n"
    "/dev/sda1 " << b.string() << " ext4 rw,relatime 0 0\n";
  setenv("RTOP_PROC_ROOT", root.c_str(), 1);
  rtop::collectors::DiskCollector c;
  auto s = c.sample(std::chrono::milliseconds(100));
  ASSERT_TRUE(s.has_value());
  ASSERT_EQ(s->mounts.size(), 1u);
  const auto& m = s->mounts[0];
  ASSERT_EQ(m.mountpoint, a.string()); // first mount point wins
  ASSERT_EQ(m.device, std::string("/dev/sda1"));
  ASSERT_TRUE(m.total_bytes > 0);
  ASSERT_TRUE(m.used_bytes <= m.total_bytes);
  ASSERT_TRUE(m.used_pct() >= 0.0 && m.used_pct() <= 100.0);
  fs::remove_all(root);
}

TEST(disk_collector_skips_missing_mountpoints) {
  auto root = make_root_disk();
  std::ofstream(root / "proc/self/mounts") << "/dev/sdz9 /definitely/not/here ext4 rw 0 0\n";
  setenv("RTOP_PROC_ROOT", root.c_str(), 1);
  rtop::collectors::DiskCollector c;
  auto s = c.sample(std::chrono::milliseconds(100));
  ASSERT_TRUE(s.has_value());
  ASSERT_TRUE(s->mounts.empty());
  fs::remove_all(root);
}

TEST(disk_mount_field_unescape_and_pseudo_fs) {
  ASSERT_EQ(rtop::collectors::unescape_mount_field("/media/My\\040Disk"), std::string("/media/My Disk"));
  ASSERT_EQ(rtop::collectors::unescape_mount_field("/plain"), std::string("/plain"));
  ASSERT_EQ(rtop::collectors::unescape_mount_field("/trail\\04"), std::string("/trail\\04"));
  ASSERT_TRUE(rtop::collectors::is_pseudo_fs("tmpfs"));
  ASSERT_TRUE(rtop::collectors::is_pseudo_fs("squashfs"));
  ASSERT_TRUE(!rtop::collectors::is_pseudo_fs("ext4"));
  ASSERT_TRUE(!rtop::collectors::is_pseudo_fs("btrfs"));
}

TEST(disk_collector_keeps_later_mount_when_first_cannot_be_measured) {
  auto root = make_root_disk();
  auto a = root / "first";
  auto b = root / "second";
  fs::create_directories(a);
  fs::create_directories(b);
  std::ofstream(root / "proc/self/mounts") <<
    "/dev/sda1 " << a.string() << " ext4 rw 0 0\n"
    "/dev/sda1 " << b.string() << " ext4 rw 0 0\n";
  setenv("RTOP_PROC_ROOT", root.c_str(), 1);
  const std::string refused = a.string();
  rtop::collectors::DiskCollector c([refused](const char* p, struct statvfs* v) {
    if (refused == p) return -1;
    return ::statvfs(p, v);
  });
  auto s = c.sample(std::chrono::milliseconds(100));
  ASSERT_TRUE(s.has_value());
  ASSERT_EQ(s->mounts.size(), 1u);
  ASSERT_EQ(s->mounts[0].mountpoint, b.string());
  fs::remove_all(root);
}
