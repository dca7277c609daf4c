#include "ui/ProcessTable.hpp"
#include "ui/Formatting.hpp"
#include "ui/Panels.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace rtop::ui {

// Right-aligned CPU% with one decimal below 10%
static std::string fmt_cpu_field(double cpu_pct, const Palette& pal) {
  std::ostringstream oss;
  if (cpu_pct < 10.0) oss << std::fixed << std::setprecision(1) << cpu_pct;
  else oss << static_cast<int>(cpu_pct + 0.5);
  std::string digits = oss.str();
  const std::string* col = nullptr;
  if (cpu_pct > 80.0) col = &pal.crit;
  else if (cpu_pct > 60.0) col = &pal.warn;
  std::string out = rpad_trunc(digits, 5);
  if (col) out = *col + out + pal.reset;
  return out;
}

static std::string fmt_mem_field(uint64_t bytes) {
  const double kib = static_cast<double>(bytes) / 1024.0;
  if (kib >= 1024.0 * 1024.0) return fixed1(kib / (1024.0 * 1024.0)) + "G";
  if (kib >= 1024.0) return std::to_string(static_cast<int>(kib / 1024.0 + 0.5)) + "M";
  return std::to_string(static_cast<int>(kib + 0.5)) + "K";
}

size_t scroll_offset(size_t selected, size_t count, size_t page) {
  if (page == 0 || count <= page) return 0;
  size_t off = selected >= page ? selected - page + 1 : 0;
  return std::min(off, count - page);
}

std::vector<std::string> render_process_table(const std::vector<app::ProcessRow>& rows,
                                              const app::ViewState& view, size_t process_count,
                                              int width, int target_rows, const Palette& pal) {
  int iw = std::max(3, width - 2);
  const int pid_w = 7, name_w = 18, cpu_w = 6, mem_w = 8;
  int cmd_w = std::max(0, iw - (pid_w + 1 + name_w + 1 + cpu_w + 1 + mem_w + 1));

  std::vector<std::string> lines;
  {
    std::ostringstream hdr;
    hdr << rpad_trunc("PID", pid_w) << " " << trunc_pad("NAME", name_w) << " "
        << rpad_trunc("CPU%", cpu_w) << " " << rpad_trunc("MEM", mem_w) << " " << trunc_pad("COMMAND", cmd_w);
    lines.push_back(pal.muted + hdr.str() + pal.reset);
  }

  // Box borders and the header take three rows
  size_t page = static_cast<size_t>(std::max(1, target_rows - 3));
  size_t first = scroll_offset(view.selected, rows.size(), page);
  for (size_t i = first; i < rows.size() && i < first + page; ++i) {
    const auto& r = rows[i];
    const auto& e = r.entry;
    std::string name = std::string(static_cast<size_t>(r.depth) * 2, ' ') + sanitize_for_display(e.name);
    std::ostringstream os;
    os << rpad_trunc(std::to_string(e.pid), pid_w) << " " << trunc_pad(name, name_w) << " "
       << " " << fmt_cpu_field(e.cpu_pct, pal) << " " << rpad_trunc(fmt_mem_field(e.memory_bytes), mem_w) << " "
       << trunc_pad(sanitize_for_display(e.cmd.empty() ? "[" + e.name + "]" : e.cmd), cmd_w);
    std::string line = os.str();
    if (i == view.selected) line = pal.select + trunc_pad(line, iw) + pal.reset;
    lines.push_back(line);
  }
  if (rows.empty()) lines.push_back(pal.muted + "no matching processes" + pal.reset);

  std::ostringstream title;
  title << "PROCESSES " << rows.size() << "/" << process_count << " sort:" << app::sort_label(view.sort);
  if (view.tree_view) title << " tree";
  if (!view.filter.empty()) title << " filter:" << sanitize_for_display(view.filter);
  return make_box(title.str(), lines, width, pal, std::max(1, target_rows - 2));
}

} // namespace rtop::ui
