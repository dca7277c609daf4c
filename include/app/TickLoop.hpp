#pragma once
#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "app/HistoryStore.hpp"
#include "app/Interaction.hpp"
#include "app/ProcessTable.hpp"
#include "app/TelemetryAggregator.hpp"
#include "app/ThemeStore.hpp"
#include "model/Snapshot.hpp"

namespace rtop::app {

// Which key map applies.
enum class InputMode { Normal, Search, ConfirmKill };

[[nodiscard]] InputMode input_mode(const InteractionState& s);

class IInputSource {
public:
  virtual ~IInputSource() = default;
  // Block up to timeout_ms for input. True if input is ready.
  virtual bool wait(int timeout_ms) = 0;
  // Decode everything currently pending under the given key map.
  virtual std::vector<Action> read_actions(InputMode mode) = 0;
};

// Read-only view of one tick. References are valid only during present().
struct Frame {
  const rtop::model::SystemSnapshot& snapshot;
  const HistoryStore& history;
  const std::vector<ProcessRow>& rows;
  const InteractionState& state;
  const ViewState& view;
  size_t process_count{};
};

class IFrameSink {
public:
  virtual ~IFrameSink() = default;
  virtual void present(const Frame& frame) = 0;
};

struct TickConfig {
  std::chrono::milliseconds sample_interval{1000};
  std::chrono::milliseconds refresh{250}; // longest input wait per tick
  std::chrono::milliseconds status_ttl{3000};
};

// Single-threaded loop: input, then sampling when due, then a redraw, every tick.
class TickLoop {
public:
  TickLoop(TelemetryAggregator& telemetry, ProcessTable& processes, HistoryStore& history,
           InteractionMachine& machine, ViewState& view, IThemeStore& themes,
           IInputSource& input, IFrameSink& sink, TickConfig cfg);

  // One iteration. Returns false once a quit action was seen.
  bool tick();

  // tick() until quit or *stop becomes true. Invariant violations from the
  // process table propagate as std::logic_error.
  void run(const std::atomic<bool>* stop = nullptr);

  // Take a sample now regardless of the interval.
  void sample_now();

  const rtop::model::SystemSnapshot& snapshot() const { return snapshot_; }
  const std::vector<ProcessRow>& rows() const { return rows_; }
  uint64_t samples_taken() const { return samples_; }

private:
  TelemetryAggregator& telemetry_;
  ProcessTable& processes_;
  HistoryStore& history_;
  InteractionMachine& machine_;
  ViewState& view_;
  IThemeStore& themes_;
  IInputSource& input_;
  IFrameSink& sink_;
  TickConfig cfg_;

  rtop::model::SystemSnapshot snapshot_{};
  std::vector<ProcessRow> rows_{};
  std::vector<std::string> interfaces_{};
  std::optional<std::chrono::steady_clock::time_point> last_sample_{};
  uint64_t samples_{0};
  bool running_{true};

  void sample(std::chrono::steady_clock::time_point now);
  void rebuild_rows();
};

} // namespace rtop::app
