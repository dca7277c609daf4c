#pragma once

#include "app/TickLoop.hpp"
#include "ui/Palette.hpp"
#include <string>
#include <vector>

namespace rtop::ui {

// Bottom line: search prompt, kill-dialog hint, status message or key help.
std::string footer_line(const app::Frame& f, int cols, const Palette& pal);

// Kill confirmation box; empty unless the kill dialog is open.
std::vector<std::string> render_kill_dialog(const app::InteractionState& state, int width, const Palette& pal);

// Full screen as `rows` lines of `cols` columns: process table on the left,
// telemetry on the right, footer last.
std::vector<std::string> compose_frame(const app::Frame& f, int cols, int rows, const Palette& pal);

// Writes each frame to stdout. In full-screen mode the cursor is homed and
// the frame sized to the terminal.
class TerminalRenderer final : public app::IFrameSink {
public:
  explicit TerminalRenderer(bool full_screen = true) : full_screen_(full_screen) {}
  void present(const app::Frame& frame) override;
private:
  bool full_screen_{true};
};

} // namespace rtop::ui
