// Scripted collaborators shared by the app-level tests.
#pragma once
#include "app/ProcessKiller.hpp"
#include "app/ThemeStore.hpp"
#include "app/TickLoop.hpp"
#include "collectors/IProcessCollector.hpp"
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fakes {

inline rtop::model::ProcSample proc(int32_t pid, int32_t ppid, const std::string& name,
                                    uint64_t ticks = 0, uint64_t rss = 0, uint64_t start = 1000) {
  rtop::model::ProcSample s;
  s.pid = pid; s.ppid = ppid; s.name = name; s.cmd = "/usr/bin/" + name;
  s.cpu_ticks = ticks; s.rss_bytes = rss; s.start_time = start; s.state = 'S';
  return s;
}

// Returns `current` on every sample(); tests edit it between refreshes.
class ScriptedProcesses : public rtop::collectors::IProcessCollector {
public:
  std::vector<rtop::model::ProcSample> current;
  unsigned cores{1};
  double tps{100.0};
  bool fail{false};

  bool sample(std::vector<rtop::model::ProcSample>& out) override {
    if (fail) return false;
    out = current;
    return true;
  }
  std::optional<rtop::model::ProcSample> read_one(int32_t pid) override {
    for (const auto& s : current) if (s.pid == pid) return s;
    return std::nullopt;
  }
  unsigned cpu_count() override { return cores; }
  double ticks_per_second() const override { return tps; }
  const char* name() const override { return "scripted"; }
};

class RecordingKiller : public rtop::app::IProcessKiller {
public:
  std::vector<int32_t> calls;
  rtop::app::TerminateResult result{rtop::app::TerminateResult::Terminated};
  rtop::app::TerminateResult terminate(int32_t pid) override { calls.push_back(pid); return result; }
};

class MemoryThemeStore : public rtop::app::IThemeStore {
public:
  std::optional<rtop::app::Theme> saved;
  bool writable{true};
  rtop::app::Theme load() override { return saved.value_or(rtop::app::Theme::Default); }
  bool save(rtop::app::Theme t) override {
    if (!writable) return false;
    saved = t;
    return true;
  }
};

// Hands out one batch of actions per wait().
class ScriptedInput : public rtop::app::IInputSource {
public:
  std::deque<std::vector<rtop::app::Action>> batches;
  std::vector<int> waits;
  std::vector<rtop::app::InputMode> modes;
  bool wait(int timeout_ms) override { waits.push_back(timeout_ms); return !batches.empty(); }
  std::vector<rtop::app::Action> read_actions(rtop::app::InputMode mode) override {
    modes.push_back(mode);
    if (batches.empty()) return {};
    auto b = std::move(batches.front());
    batches.pop_front();
    return b;
  }
};

// Copies what it needs out of each frame; frame references die after present().
class RecordingSink : public rtop::app::IFrameSink {
public:
  struct Seen {
    uint64_t seq{};
    std::vector<int32_t> pids;
    std::string status;
    std::string filter;
    bool normal{true};
    size_t process_count{};
  };
  std::vector<Seen> frames;
  void present(const rtop::app::Frame& f) override {
    Seen s;
    s.seq = f.snapshot.seq;
    for (const auto& r : f.rows) s.pids.push_back(r.entry.pid);
    s.status = f.view.status;
    s.filter = f.view.filter;
    s.normal = std::holds_alternative<rtop::app::NormalState>(f.state);
    s.process_count = f.process_count;
    frames.push_back(std::move(s));
  }
};

inline rtop::app::Action act(rtop::app::ActionKind k, char ch = 0) { return rtop::app::Action{k, ch}; }

} // namespace fakes
