#include "app/ProcessTable.hpp"
#include "util/AsciiLower.hpp"
#include "util/Log.hpp"
#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace rtop::app {

using rtop::model::ProcessEntry;
using rtop::model::ProcessTree;
using rtop::model::ProcSample;
using rtop::model::TreeRow;

SortMode next_sort(SortMode m) {
  switch (m) {
    case SortMode::Cpu: return SortMode::Memory;
    case SortMode::Memory: return SortMode::Pid;
    case SortMode::Pid: return SortMode::Name;
    case SortMode::Name: return SortMode::Cpu;
  }
  return SortMode::Cpu;
}

std::string_view sort_label(SortMode m) {
  switch (m) {
    case SortMode::Cpu: return "CPU";
    case SortMode::Memory: return "MEM";
    case SortMode::Pid: return "PID";
    case SortMode::Name: return "NAME";
  }
  return "CPU";
}

bool sort_before(SortMode mode, const ProcessEntry& a, const ProcessEntry& b) {
  switch (mode) {
    case SortMode::Cpu:
      if (a.cpu_pct != b.cpu_pct) return a.cpu_pct > b.cpu_pct;
      break;
    case SortMode::Memory:
      if (a.memory_bytes != b.memory_bytes) return a.memory_bytes > b.memory_bytes;
      break;
    case SortMode::Pid:
      break;
    case SortMode::Name:
      if (int c = rtop::util::compare_ci(a.name, b.name); c != 0) return c < 0;
      break;
  }
  return a.pid < b.pid;
}

std::vector<ProcessEntry> sort_entries(std::vector<ProcessEntry> entries, SortMode mode) {
  std::sort(entries.begin(), entries.end(), [mode](const ProcessEntry& a, const ProcessEntry& b){ return sort_before(mode, a, b); });
  return entries;
}

std::vector<ProcessEntry> filter_entries(const std::vector<ProcessEntry>& entries, std::string_view query) {
  if (query.empty()) return entries;
  std::vector<ProcessEntry> out;
  for (const auto& e : entries)
    if (rtop::util::contains_ci(e.name, query)) out.push_back(e);
  return out;
}

ProcessTree build_tree(const std::vector<ProcessEntry>& entries, SortMode mode) {
  std::unordered_map<int32_t, const ProcessEntry*> by_pid;
  for (const auto& e : entries) by_pid.emplace(e.pid, &e);

  std::unordered_map<int32_t, std::vector<const ProcessEntry*>> children;
  std::vector<const ProcessEntry*> roots;
  for (const auto& e : entries) {
    if (e.ppid == e.pid || !by_pid.contains(e.ppid)) roots.push_back(&e);
    else children[e.ppid].push_back(&e);
  }
  auto by_mode = [mode](const ProcessEntry* a, const ProcessEntry* b){ return sort_before(mode, *a, *b); };
  std::sort(roots.begin(), roots.end(), by_mode);
  for (auto& [ppid, kids] : children) std::sort(kids.begin(), kids.end(), by_mode);

  ProcessTree out;
  out.reserve(entries.size());
  std::unordered_set<int32_t> visited;
  auto walk = [&](const ProcessEntry* root) {
    std::vector<std::pair<const ProcessEntry*, int>> stack{{root, 0}};
    while (!stack.empty()) {
      auto [e, depth] = stack.back();
      stack.pop_back();
      if (!visited.insert(e->pid).second) continue;
      out.push_back(TreeRow{e->pid, depth});
      if (auto it = children.find(e->pid); it != children.end()) {
        for (auto k = it->second.rbegin(); k != it->second.rend(); ++k) stack.emplace_back(*k, depth + 1);
      }
    }
  };
  for (const auto* r : roots) walk(r);
  // A parent cycle has no root; surface its members at the top level rather than dropping them
  if (out.size() < entries.size()) {
    std::vector<const ProcessEntry*> rest;
    for (const auto& e : entries) if (!visited.contains(e.pid)) rest.push_back(&e);
    std::sort(rest.begin(), rest.end(), by_mode);
    for (const auto* r : rest) walk(r);
  }
  return out;
}

ProcessTable::ProcessTable(rtop::collectors::IProcessCollector& source, IProcessKiller& killer, bool smooth_cpu)
  : source_(source), killer_(killer), smooth_cpu_(smooth_cpu) {}

void ProcessTable::refresh(std::chrono::steady_clock::time_point now) {
  std::vector<ProcSample> samples;
  if (!source_.sample(samples)) {
    rtop::util::log_once("proc:sample", "process source '%s' returned no data", source_.name());
    return; // keep the previous table rather than showing an empty one
  }
  double elapsed = last_refresh_ ? std::chrono::duration<double>(now - *last_refresh_).count() : 0.0;
  double ncpu = static_cast<double>(std::max(1u, source_.cpu_count()));
  double tps = source_.ticks_per_second();
  double alpha = std::clamp(elapsed / 1.5, 0.35, 1.0);

  std::unordered_map<int32_t, Tracked> next;
  next.reserve(samples.size());
  std::vector<ProcessEntry> entries;
  entries.reserve(samples.size());
  for (auto& s : samples) {
    if (next.contains(s.pid))
      throw std::logic_error("duplicate pid " + std::to_string(s.pid) + " in process snapshot");

    double raw = 0.0;
    double ema = 0.0;
    bool continued = false;
    if (auto it = tracked_.find(s.pid); it != tracked_.end()) {
      // Same pid but a different start time or name is a new process
      continued = it->second.start_time == s.start_time && it->second.name == s.name;
      if (continued && elapsed > 0.0 && tps > 0.0) {
        uint64_t d = s.cpu_ticks >= it->second.cpu_ticks ? s.cpu_ticks - it->second.cpu_ticks : 0;
        raw = std::clamp(static_cast<double>(d) / tps / elapsed / ncpu * 100.0, 0.0, 100.0);
      }
      if (continued) ema = it->second.ema;
    }
    double shown = raw;
    if (smooth_cpu_ && continued) shown = ema + alpha * (raw - ema);

    ProcessEntry e;
    e.pid = s.pid;
    e.ppid = s.ppid;
    e.state = s.state;
    e.name = std::move(s.name);
    e.cmd = std::move(s.cmd);
    e.cpu_pct = shown;
    e.memory_bytes = s.rss_bytes;
    e.start_time = s.start_time;
    next.emplace(e.pid, Tracked{e.start_time, e.name, s.cpu_ticks, shown});
    entries.push_back(std::move(e));
  }
  std::sort(entries.begin(), entries.end(), [](const ProcessEntry& a, const ProcessEntry& b){ return a.pid < b.pid; });

  // Processes missing from this sample are dropped along with their history
  tracked_ = std::move(next);
  entries_ = std::move(entries);
  tree_ = build_tree(entries_, SortMode::Cpu);
  last_refresh_ = now;
}

const ProcessEntry* ProcessTable::find(int32_t pid) const {
  auto it = std::lower_bound(entries_.begin(), entries_.end(), pid,
                             [](const ProcessEntry& e, int32_t p){ return e.pid < p; });
  return (it != entries_.end() && it->pid == pid) ? &*it : nullptr;
}

std::vector<ProcessRow> ProcessTable::visible_rows(SortMode mode, std::string_view filter, bool tree_view) const {
  std::vector<ProcessRow> rows;
  if (!tree_view) {
    for (auto& e : sort_entries(filter_entries(entries_, filter), mode)) rows.push_back(ProcessRow{std::move(e), 0});
    return rows;
  }
  for (const auto& r : build_tree(entries_, mode)) {
    const auto* e = find(r.pid);
    if (!e || !rtop::util::contains_ci(e->name, filter)) continue;
    rows.push_back(ProcessRow{*e, r.depth});
  }
  return rows;
}

TerminateResult ProcessTable::request_terminate(int32_t pid, uint64_t start_time) {
  auto live = source_.read_one(pid);
  if (!live || live->start_time != start_time) return TerminateResult::NoSuchProcess;
  return killer_.terminate(pid);
}

} // namespace rtop::app
