#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include "app/ProcessKiller.hpp"
#include "collectors/IProcessCollector.hpp"
#include "model/Process.hpp"

namespace rtop::app {

enum class SortMode { Cpu, Memory, Pid, Name };

// Cpu -> Memory -> Pid -> Name -> Cpu
[[nodiscard]] SortMode next_sort(SortMode m);
[[nodiscard]] std::string_view sort_label(SortMode m);

// Cpu and Memory descending, Pid ascending, Name case-insensitive ascending;
// ties always fall back to ascending pid.
[[nodiscard]] bool sort_before(SortMode mode, const rtop::model::ProcessEntry& a, const rtop::model::ProcessEntry& b);

[[nodiscard]] std::vector<rtop::model::ProcessEntry> sort_entries(std::vector<rtop::model::ProcessEntry> entries, SortMode mode);

// Case-insensitive substring match on the process name. Empty query keeps everything.
[[nodiscard]] std::vector<rtop::model::ProcessEntry> filter_entries(const std::vector<rtop::model::ProcessEntry>& entries, std::string_view query);

// Depth-first rows. A process whose parent is not in `entries` is a root;
// siblings are ordered by `mode`.
[[nodiscard]] rtop::model::ProcessTree build_tree(const std::vector<rtop::model::ProcessEntry>& entries, SortMode mode);

// One row of the process panel.
struct ProcessRow {
  rtop::model::ProcessEntry entry;
  int depth{};
};

class ProcessTable {
public:
  ProcessTable(rtop::collectors::IProcessCollector& source, IProcessKiller& killer, bool smooth_cpu = true);

  // Re-read the process list and recompute CPU%. Throws std::logic_error if
  // the source reports the same pid twice.
  void refresh(std::chrono::steady_clock::time_point now);

  // Current entries in ascending pid order.
  const std::vector<rtop::model::ProcessEntry>& entries() const { return entries_; }

  // Tree of the current entries, siblings by CPU.
  const rtop::model::ProcessTree& tree() const { return tree_; }

  const rtop::model::ProcessEntry* find(int32_t pid) const;

  // Rows for display: filtered then sorted, or in tree order with
  // non-matching rows hidden.
  std::vector<ProcessRow> visible_rows(SortMode mode, std::string_view filter, bool tree_view) const;

  // SIGTERM the process if it is still the one that was selected (same pid
  // and start time). Exactly one signal attempt, no retry.
  TerminateResult request_terminate(int32_t pid, uint64_t start_time);

private:
  struct Tracked {
    uint64_t start_time{};
    std::string name;
    uint64_t cpu_ticks{};
    double ema{};
  };

  rtop::collectors::IProcessCollector& source_;
  IProcessKiller& killer_;
  bool smooth_cpu_{true};
  std::vector<rtop::model::ProcessEntry> entries_{};
  rtop::model::ProcessTree tree_{};
  std::unordered_map<int32_t, Tracked> tracked_{};
  std::optional<std::chrono::steady_clock::time_point> last_refresh_{};
};

} // namespace rtop::app
