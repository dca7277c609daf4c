#include "minitest.hpp"
#include "util/Procfs.hpp"
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

TEST(procfs_roots_name_the_parent_of_the_tree) {
  setenv("RTOP_PROC_ROOT", "/tmp/fake", 1);
  setenv("RTOP_SYS_ROOT", "/tmp/fake", 1);
  ASSERT_EQ(rtop::util::map_path("/proc/stat"), std::string("/tmp/fake/proc/stat"));
  ASSERT_EQ(rtop::util::map_path("/sys/class/drm"), std::string("/tmp/fake/sys/class/drm"));
  ASSERT_EQ(rtop::util::map_path("/etc/hostname"), std::string("/etc/hostname"));
  unsetenv("RTOP_PROC_ROOT");
  unsetenv("RTOP_SYS_ROOT");
  ASSERT_EQ(rtop::util::map_path("/sys/class/drm"), std::string("/sys/class/drm"));
}

TEST(procfs_reads_through_the_remapped_root) {
  auto root = fs::temp_directory_path() / ("rtop_test_procfs_" + std::to_string(::getpid()));
  fs::remove_all(root);
  fs::create_directories(root / "sys/class/hwmon/hwmon0");
  std::ofstream(root / "sys/class/hwmon/hwmon0/temp1_input") << "61000\n";
  setenv("RTOP_SYS_ROOT", root.c_str(), 1);
  auto v = rtop::util::read_file_u64("/sys/class/hwmon/hwmon0/temp1_input");
  ASSERT_TRUE(v.has_value());
  ASSERT_EQ(*v, 61000u);
  auto missing = rtop::util::read_file_checked("/sys/class/hwmon/hwmon0/temp2_input");
  ASSERT_TRUE(!missing.has_value());
  ASSERT_EQ(missing.error(), ENOENT);
  unsetenv("RTOP_SYS_ROOT");
  fs::remove_all(root);
}
