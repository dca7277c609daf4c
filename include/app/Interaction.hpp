#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "app/ProcessTable.hpp"
#include "app/ThemeStore.hpp"

namespace rtop::app {

enum class ActionKind {
  Quit,
  MoveUp, MoveDown, PageUp, PageDown,
  CycleSort, ToggleTree, CycleInterface, CycleTheme, SaveTheme, TogglePause,
  StartSearch, InsertChar, Backspace,
  RequestKill, ToggleChoice,
  Confirm, Cancel,
};

struct Action {
  ActionKind kind{ActionKind::Quit};
  char ch{}; // InsertChar payload
};

enum class KillChoice { Yes, No };

struct NormalState {};

struct SearchingState {
  std::string query;
  std::string previous_filter; // restored on cancel
};

struct ConfirmingKillState {
  int32_t target_pid{};
  std::string target_name;
  uint64_t start_time{}; // identity check against pid reuse
  KillChoice choice{KillChoice::Yes};
};

// Exactly one mode is active at a time.
using InteractionState = std::variant<NormalState, SearchingState, ConfirmingKillState>;

// View settings owned by the loop and mutated only through dispatch().
struct ViewState {
  SortMode sort{SortMode::Cpu};
  bool tree_view{false};
  bool paused{false};                   // sampling stopped; input and redraw continue
  std::string filter;
  size_t selected{0};
  size_t page_rows{10};
  std::optional<std::string> interface; // nullopt = all interfaces
  Theme theme{Theme::Default};
  std::string status;
  std::chrono::steady_clock::time_point status_at{};

  void set_status(std::string msg, std::chrono::steady_clock::time_point now) { status = std::move(msg); status_at = now; }
};

// Everything an action may read or change.
struct InteractionContext {
  ProcessTable& processes;
  ViewState& view;
  IThemeStore& themes;
  const std::vector<ProcessRow>& rows;        // rows currently on screen
  const std::vector<std::string>& interfaces; // sorted interface names from the latest sample
  std::chrono::steady_clock::time_point now{};
};

// Next interface in the cycle None -> first -> ... -> last -> None.
[[nodiscard]] std::optional<std::string> next_interface(const std::optional<std::string>& current,
                                                        const std::vector<std::string>& names);

class InteractionMachine {
public:
  const InteractionState& state() const { return state_; }
  bool is_normal() const { return std::holds_alternative<NormalState>(state_); }

  // Apply one action. Returns false when the program should quit.
  bool dispatch(const Action& action, InteractionContext& ctx);

private:
  InteractionState state_{NormalState{}};

  void on_normal(const Action& a, InteractionContext& ctx);
  void on_search(SearchingState& s, const Action& a, InteractionContext& ctx);
  void on_confirm_kill(ConfirmingKillState& k, const Action& a, InteractionContext& ctx);
  static void save_theme(InteractionContext& ctx, bool announce_name);
};

} // namespace rtop::app
