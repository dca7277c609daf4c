#pragma once

#include "app/Interaction.hpp"
#include "ui/Palette.hpp"
#include <string>
#include <vector>

namespace rtop::ui {

// First row index to draw so that `selected` stays within a page of `page` rows.
[[nodiscard]] size_t scroll_offset(size_t selected, size_t count, size_t page);

// Process list box: PID, NAME, CPU%, MEM, COMMAND. Tree rows indent NAME by depth.
std::vector<std::string> render_process_table(const std::vector<app::ProcessRow>& rows,
                                              const app::ViewState& view, size_t process_count,
                                              int width, int target_rows, const Palette& pal);

} // namespace rtop::ui
