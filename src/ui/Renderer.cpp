#include "ui/Renderer.hpp"
#include "ui/Formatting.hpp"
#include "ui/Panels.hpp"
#include "ui/ProcessTable.hpp"
#include "ui/Terminal.hpp"
#include <algorithm>
#include <unistd.h>

namespace rtop::ui {

std::string footer_line(const app::Frame& f, int cols, const Palette& pal) {
  if (const auto* s = std::get_if<app::SearchingState>(&f.state)) {
    return trunc_pad(pal.title + "Search: " + pal.reset + sanitize_for_display(s->query) + "_" +
                     pal.muted + "   Enter apply  Esc cancel" + pal.reset, cols);
  }
  if (std::holds_alternative<app::ConfirmingKillState>(f.state)) {
    return trunc_pad(pal.muted + "Left/Right choose  Enter confirm  Esc cancel" + pal.reset, cols);
  }
  std::string right = (f.view.paused ? pal.warn + "PAUSED" + pal.reset + "  " : std::string()) +
                      sanitize_for_display(read_hostname()) + "  up " + read_uptime_formatted() + "  " + format_time_now();
  std::string left = f.view.status.empty()
      ? pal.muted + "q quit  / search  s sort  T tree  k kill  i iface  t theme  w save  c pause" + pal.reset
      : pal.warn + sanitize_for_display(f.view.status) + pal.reset;
  return lr_align(cols, left, right);
}

std::vector<std::string> render_kill_dialog(const app::InteractionState& state, int width, const Palette& pal) {
  const auto* k = std::get_if<app::ConfirmingKillState>(&state);
  if (!k) return {};
  const bool yes = k->choice == app::KillChoice::Yes;
  std::string yes_btn = yes ? pal.select + "[ Yes ]" + pal.reset : "  Yes  ";
  std::string no_btn = !yes ? pal.select + "[ No ]" + pal.reset : "  No  ";
  std::vector<std::string> lines{
    "Send SIGTERM to " + sanitize_for_display(k->target_name) + " (" + std::to_string(k->target_pid) + ")?",
    "",
    "      " + yes_btn + "    " + no_btn,
  };
  return make_box("TERMINATE", lines, width, pal);
}

std::vector<std::string> compose_frame(const app::Frame& f, int cols, int rows, const Palette& pal) {
  cols = std::max(cols, 40);
  rows = std::max(rows, 6);
  const int gutter = 1;
  int left_w = (cols * 3) / 5;
  if (cols - left_w - gutter < 30) left_w = std::max(20, cols - gutter - 30);
  int right_w = cols - left_w - gutter;
  int body_rows = rows - 1;

  auto left = render_process_table(f.rows, f.view, f.process_count, left_w, body_rows, pal);
  auto right = render_right_column(f.snapshot, f.history, right_w, body_rows, pal);

  std::vector<std::string> out;
  out.reserve(static_cast<size_t>(rows));
  for (int row = 0; row < body_rows; ++row) {
    std::string l = row < (int)left.size() ? left[row] : std::string();
    std::string r = row < (int)right.size() ? right[row] : std::string();
    out.push_back(trunc_pad(l, left_w) + std::string(gutter, ' ') + trunc_pad(r, right_w));
  }

  auto dialog = render_kill_dialog(f.state, std::min(cols - 4, 56), pal);
  if (!dialog.empty()) {
    int dw = display_cols(dialog.front());
    int top = std::max(0, (body_rows - (int)dialog.size()) / 2);
    int pad = std::max(0, (cols - dw) / 2);
    for (size_t i = 0; i < dialog.size() && top + (int)i < body_rows; ++i)
      out[top + i] = trunc_pad(std::string(pad, ' ') + dialog[i], cols);
  }

  out.push_back(footer_line(f, cols, pal));
  return out;
}

void TerminalRenderer::present(const app::Frame& frame) {
  const Palette pal = palette_for(frame.view.theme);
  const int cols = term_cols();
  const int rows = full_screen_ ? term_rows() : std::max(24, term_rows());
  auto lines = compose_frame(frame, cols, rows, pal);
  std::string out;
  out.reserve(static_cast<size_t>(rows) * static_cast<size_t>(cols) + 64);
  if (full_screen_) out += "\x1B[H";
  for (size_t i = 0; i < lines.size(); ++i) {
    out += lines[i];
    out += pal.reset;
    if (full_screen_) out += "\x1B[K";
    if (i + 1 < lines.size() || !full_screen_) out += "\n";
  }
  best_effort_write(STDOUT_FILENO, out.data(), out.size());
}

} // namespace rtop::ui
