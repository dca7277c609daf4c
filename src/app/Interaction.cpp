#include "app/Interaction.hpp"
#include "util/AsciiLower.hpp"
#include <algorithm>

namespace rtop::app {

std::optional<std::string> next_interface(const std::optional<std::string>& current,
                                          const std::vector<std::string>& names) {
  if (names.empty()) return std::nullopt;
  if (!current) return names.front();
  auto it = std::find(names.begin(), names.end(), *current);
  // A vanished interface restarts the cycle at the first one
  if (it == names.end()) return names.front();
  if (++it == names.end()) return std::nullopt;
  return *it;
}

bool InteractionMachine::dispatch(const Action& a, InteractionContext& ctx) {
  if (a.kind == ActionKind::Quit) return false;
  if (auto* s = std::get_if<SearchingState>(&state_)) on_search(*s, a, ctx);
  else if (auto* k = std::get_if<ConfirmingKillState>(&state_)) on_confirm_kill(*k, a, ctx);
  else on_normal(a, ctx);
  return true;
}

void InteractionMachine::save_theme(InteractionContext& ctx, bool announce_name) {
  std::string name(theme_name(ctx.view.theme));
  if (ctx.themes.save(ctx.view.theme))
    ctx.view.set_status(announce_name ? "Theme: " + name : "Theme saved: " + name, ctx.now);
  else
    ctx.view.set_status("Could not save theme " + name, ctx.now);
}

void InteractionMachine::on_normal(const Action& a, InteractionContext& ctx) {
  auto& v = ctx.view;
  const size_t last = ctx.rows.empty() ? 0 : ctx.rows.size() - 1;
  switch (a.kind) {
    case ActionKind::MoveUp: if (v.selected > 0) --v.selected; break;
    case ActionKind::MoveDown: v.selected = std::min(v.selected + 1, last); break;
    case ActionKind::PageUp: v.selected = v.selected > v.page_rows ? v.selected - v.page_rows : 0; break;
    case ActionKind::PageDown: v.selected = std::min(v.selected + v.page_rows, last); break;
    case ActionKind::CycleSort:
      v.sort = next_sort(v.sort);
      v.set_status("Sort: " + std::string(sort_label(v.sort)), ctx.now);
      break;
    case ActionKind::ToggleTree:
      v.tree_view = !v.tree_view;
      v.set_status(v.tree_view ? "Tree view" : "List view", ctx.now);
      break;
    case ActionKind::CycleInterface:
      v.interface = next_interface(v.interface, ctx.interfaces);
      v.set_status("Interface: " + v.interface.value_or("all"), ctx.now);
      break;
    case ActionKind::CycleTheme:
      v.theme = next_theme(v.theme);
      save_theme(ctx, true);
      break;
    case ActionKind::SaveTheme:
      save_theme(ctx, false);
      break;
    case ActionKind::TogglePause:
      v.paused = !v.paused;
      v.set_status(v.paused ? "Updates paused" : "Updates resumed", ctx.now);
      break;
    case ActionKind::StartSearch:
      state_ = SearchingState{v.filter, v.filter};
      break;
    case ActionKind::RequestKill: {
      if (ctx.rows.empty() || v.selected >= ctx.rows.size()) {
        v.set_status("No process selected", ctx.now);
        break;
      }
      const auto& e = ctx.rows[v.selected].entry;
      state_ = ConfirmingKillState{e.pid, e.name, e.start_time, KillChoice::Yes};
      break;
    }
    default:
      break; // modal-only actions are ignored in Normal
  }
}

void InteractionMachine::on_search(SearchingState& s, const Action& a, InteractionContext& ctx) {
  auto& v = ctx.view;
  switch (a.kind) {
    case ActionKind::InsertChar:
      s.query.push_back(a.ch);
      break;
    case ActionKind::Backspace:
      if (!s.query.empty()) s.query.pop_back();
      break;
    case ActionKind::Cancel:
      v.filter = s.previous_filter;
      v.set_status("Search canceled", ctx.now);
      state_ = NormalState{};
      break;
    case ActionKind::Confirm:
      v.filter = std::string(rtop::util::trim(s.query));
      v.selected = 0;
      v.set_status(v.filter.empty() ? "Filter cleared" : "Filter: " + v.filter, ctx.now);
      state_ = NormalState{};
      break;
    default:
      break; // no nested modal: StartSearch/RequestKill do nothing here
  }
}

void InteractionMachine::on_confirm_kill(ConfirmingKillState& k, const Action& a, InteractionContext& ctx) {
  auto& v = ctx.view;
  switch (a.kind) {
    case ActionKind::ToggleChoice:
      k.choice = k.choice == KillChoice::Yes ? KillChoice::No : KillChoice::Yes;
      break;
    case ActionKind::Confirm: {
      if (k.choice == KillChoice::No) {
        v.set_status("Termination canceled", ctx.now);
        state_ = NormalState{};
        break;
      }
      const auto pid = k.target_pid;
      const std::string name = k.target_name;
      const std::string who = name + " (" + std::to_string(pid) + ")";
      // state_ is reset before acting so k is not used after this point
      auto start_time = k.start_time;
      state_ = NormalState{};
      switch (ctx.processes.request_terminate(pid, start_time)) {
        case TerminateResult::Terminated: v.set_status("SIGTERM sent to " + who, ctx.now); break;
        case TerminateResult::NoSuchProcess: v.set_status("Process " + std::to_string(pid) + " no longer exists", ctx.now); break;
        case TerminateResult::PermissionDenied: v.set_status("Permission denied terminating " + who, ctx.now); break;
      }
      break;
    }
    case ActionKind::Cancel:
      v.set_status("Termination canceled", ctx.now);
      state_ = NormalState{};
      break;
    default:
      break;
  }
}

} // namespace rtop::app
