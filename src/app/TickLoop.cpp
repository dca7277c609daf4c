#include "app/TickLoop.hpp"
#include <algorithm>

namespace rtop::app {

using Clock = std::chrono::steady_clock;

InputMode input_mode(const InteractionState& s) {
  if (std::holds_alternative<SearchingState>(s)) return InputMode::Search;
  if (std::holds_alternative<ConfirmingKillState>(s)) return InputMode::ConfirmKill;
  return InputMode::Normal;
}

TickLoop::TickLoop(TelemetryAggregator& telemetry, ProcessTable& processes, HistoryStore& history,
                   InteractionMachine& machine, ViewState& view, IThemeStore& themes,
                   IInputSource& input, IFrameSink& sink, TickConfig cfg)
  : telemetry_(telemetry), processes_(processes), history_(history), machine_(machine), view_(view),
    themes_(themes), input_(input), sink_(sink), cfg_(cfg) {}

void TickLoop::rebuild_rows() {
  rows_ = processes_.visible_rows(view_.sort, view_.filter, view_.tree_view);
  if (rows_.empty()) view_.selected = 0;
  else view_.selected = std::min(view_.selected, rows_.size() - 1);
}

void TickLoop::sample(Clock::time_point now) {
  snapshot_ = telemetry_.collect(view_.interface);
  processes_.refresh(now);
  history_.append(snapshot_);
  interfaces_.clear();
  if (snapshot_.network)
    for (const auto& nif : snapshot_.network->interfaces) interfaces_.push_back(nif.name);
  last_sample_ = now;
  ++samples_;
}

void TickLoop::sample_now() {
  sample(Clock::now());
  rebuild_rows();
}

bool TickLoop::tick() {
  // (1) Wait for input or the next sample deadline, whichever is sooner
  auto now = Clock::now();
  auto wait = cfg_.refresh;
  if (!last_sample_) {
    wait = std::chrono::milliseconds(0);
  } else if (!view_.paused) {
    auto due = *last_sample_ + cfg_.sample_interval;
    auto until = std::chrono::duration_cast<std::chrono::milliseconds>(due - now);
    wait = std::clamp(until, std::chrono::milliseconds(0), cfg_.refresh);
  }
  if (input_.wait(static_cast<int>(wait.count()))) {
    for (const auto& a : input_.read_actions(input_mode(machine_.state()))) {
      InteractionContext ctx{processes_, view_, themes_, rows_, interfaces_, Clock::now()};
      if (!machine_.dispatch(a, ctx)) { running_ = false; break; }
      rebuild_rows(); // later actions in the batch see the updated list
    }
  }
  if (!running_) return false;

  // (2) Sample when due. Paused keeps the last snapshot once there is one
  now = Clock::now();
  if (!last_sample_ || (!view_.paused && now - *last_sample_ >= cfg_.sample_interval)) sample(now);

  // (3) Always redraw so input is reflected between samples
  if (!view_.status.empty() && now - view_.status_at >= cfg_.status_ttl) view_.status.clear();
  rebuild_rows();
  Frame frame{snapshot_, history_, rows_, machine_.state(), view_, processes_.entries().size()};
  sink_.present(frame);
  return true;
}

void TickLoop::run(const std::atomic<bool>* stop) {
  while (running_) {
    if (stop && stop->load()) break;
    if (!tick()) break;
  }
}

} // namespace rtop::app
