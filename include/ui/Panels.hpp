#pragma once

#include "app/HistoryStore.hpp"
#include "model/Snapshot.hpp"
#include "ui/Palette.hpp"
#include <string>
#include <vector>

namespace rtop::ui {

// Box drawing; lines are truncated or padded to the inner width.
std::vector<std::string> make_box(const std::string& title, const std::vector<std::string>& lines,
                                  int width, const Palette& pal, int min_height = 0);

// Individual panel renderers (boxed, `width` columns wide)
std::vector<std::string> render_cpu_panel(const model::SystemSnapshot& s, const app::HistoryStore& h, int width, const Palette& pal);
std::vector<std::string> render_memory_panel(const model::SystemSnapshot& s, const app::HistoryStore& h, int width, const Palette& pal);
std::vector<std::string> render_network_panel(const model::SystemSnapshot& s, const app::HistoryStore& h, int width, const Palette& pal);
std::vector<std::string> render_disk_panel(const model::SystemSnapshot& s, int width, const Palette& pal, int max_mounts);
std::vector<std::string> render_gpu_panel(const model::SystemSnapshot& s, const app::HistoryStore& h, int width, const Palette& pal);

// Telemetry column: CPU, memory, GPU, network, disks; clipped to target_rows.
std::vector<std::string> render_right_column(const model::SystemSnapshot& s, const app::HistoryStore& h,
                                             int width, int target_rows, const Palette& pal);

} // namespace rtop::ui
