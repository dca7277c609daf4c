#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace rtop::model {

// Raw per-process sample as read from the OS, before any delta math.
struct ProcSample {
  int32_t pid{};
  int32_t ppid{};
  char state{'?'};
  uint64_t cpu_ticks{};   // utime + stime, clock ticks
  uint64_t start_time{};  // clock ticks since boot
  uint64_t rss_bytes{};
  std::string name;       // comm
  std::string cmd;        // cmdline, spaces for NULs; empty for kernel threads
};

struct ProcessEntry {
  int32_t pid{};
  int32_t ppid{};
  char state{'?'};
  std::string name;
  std::string cmd;
  double cpu_pct{};       // normalized by core count, 0..100
  uint64_t memory_bytes{};
  uint64_t start_time{};
};

struct TreeRow {
  int32_t pid{};
  int depth{};
};

using ProcessTree = std::vector<TreeRow>;

} // namespace rtop::model
