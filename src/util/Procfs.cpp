#include "util/Procfs.hpp"

#include <sys/types.h>
#include <dirent.h>
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <filesystem>

namespace rtop::util {

static std::string env_root(const char* name) {
  const char* env = std::getenv(name);
  if (env && *env) return std::string(env);
  return std::string();
}

static std::string remap(const std::string& abs, const char* prefix, const char* env_name) {
  if (abs.rfind(prefix, 0) != 0) return abs;
  auto root = env_root(env_name);
  if (root.empty()) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.substr(1)); // drop leading '/'
  return p.string();
}

auto map_proc_path(const std::string& abs) -> std::string {
  return remap(abs, "/proc", "RTOP_PROC_ROOT");
}

auto map_sys_path(const std::string& abs) -> std::string {
  return remap(abs, "/sys", "RTOP_SYS_ROOT");
}

auto map_path(const std::string& abs) -> std::string {
  if (abs.rfind("/proc", 0) == 0) return map_proc_path(abs);
  if (abs.rfind("/sys", 0) == 0) return map_sys_path(abs);
  return abs;
}

// Plain read(2) loop: procfs and sysfs report st_size 0, so read until EOF.
static int slurp(const std::string& path, std::string& out) {
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) return errno;
  char buf[8192];
  for (;;) {
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n == 0) break;
    if (n < 0) {
      if (errno == EINTR) continue;
      int err = errno; ::close(fd); return err;
    }
    out.append(buf, static_cast<size_t>(n));
  }
  ::close(fd);
  return 0;
}

auto read_file_string(const std::string& abs) -> std::optional<std::string> {
  std::string s;
  if (slurp(map_path(abs), s) != 0) return std::nullopt;
  return s;
}

auto read_file_checked(const std::string& abs) -> std::expected<std::string, int> {
  std::string s;
  if (int err = slurp(map_path(abs), s); err != 0) return std::unexpected(err);
  return s;
}

auto read_file_bytes(const std::string& abs) -> std::optional<std::vector<unsigned char>> {
  std::string s;
  if (slurp(map_path(abs), s) != 0) return std::nullopt;
  return std::vector<unsigned char>(s.begin(), s.end());
}

auto read_file_u64(const std::string& abs) -> std::optional<uint64_t> {
  auto txt = read_file_string(abs);
  if (!txt) return std::nullopt;
  const char* b = txt->data(); const char* e = b + txt->size();
  while (b < e && (*b == ' ' || *b == '\t')) ++b;
  uint64_t v = 0;
  auto [ptr, ec] = std::from_chars(b, e, v);
  if (ec != std::errc{} || ptr == b) return std::nullopt;
  return v;
}

auto list_dir(const std::string& abs) -> std::vector<std::string> {
  std::vector<std::string> out;
  auto path = map_path(abs);
  DIR* d = ::opendir(path.c_str());
  if (!d) return out;
  while (auto* ent = ::readdir(d)) {
    const char* name = ent->d_name;
    if (std::strcmp(name, ".") == 0 || std::strcmp(name, "..") == 0) continue;
    out.emplace_back(name);
  }
  ::closedir(d);
  return out;
}

} // namespace rtop::util
