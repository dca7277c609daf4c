// Helpers for reading /proc and /sys with an optional alternate root
#pragma once
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace rtop::util {

// Map an absolute /proc path under RTOP_PROC_ROOT when set. The variable names
// the parent of the fake tree: /proc/stat becomes $RTOP_PROC_ROOT/proc/stat.
auto map_proc_path(const std::string& abs) -> std::string;

// Same convention for /sys and RTOP_SYS_ROOT.
auto map_sys_path(const std::string& abs) -> std::string;

// Apply whichever of the two remaps matches abs
auto map_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// Like read_file_string but reports errno on failure (EACCES, ENOENT, ...)
auto read_file_checked(const std::string& abs) -> std::expected<std::string, int>;

// Read entire file as bytes. Returns std::nullopt on error.
auto read_file_bytes(const std::string& abs) -> std::optional<std::vector<unsigned char>>;

// Parse the leading unsigned integer of a file (sysfs counters)
auto read_file_u64(const std::string& abs) -> std::optional<uint64_t>;

// List directory entries (names only). Returns empty vector on error.
auto list_dir(const std::string& abs) -> std::vector<std::string>;

} // namespace rtop::util
