#include "ui/Panels.hpp"
#include "collectors/CpuCollector.hpp"
#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"
#include <algorithm>
#include <cstdio>
#include <sstream>

namespace rtop::ui {

using model::UnavailableReason;

static std::string repeat_str(const std::string& ch, int n){
  std::string r;
  r.reserve(std::max(0, n * (int)ch.size()));
  for (int i = 0; i < n; i++) r += ch;
  return r;
}

std::vector<std::string> make_box(const std::string& title, const std::vector<std::string>& lines,
                                  int width, const Palette& pal, int min_height) {
  int iw = std::max(3, width - 2);
  std::vector<std::string> out;
  const bool uni = use_unicode();
  const std::string TL = uni? "\xE2\x95\xAD" : "+";
  const std::string TR = uni? "\xE2\x95\xAE" : "+";
  const std::string BL = uni? "\xE2\x95\xB0" : "+";
  const std::string BR = uni? "\xE2\x95\xAF" : "+";
  const std::string H  = uni? "\xE2\x94\x80" : "-";
  const std::string V  = uni? "\xE2\x94\x82" : "|";
  {
    std::string t = "[ " + title + " ]";
    int fill = std::max(0, iw - display_cols(t));
    int left = fill / 2; int right = fill - left;
    out.push_back(pal.border + TL + repeat_str(H, left) + pal.title + t + pal.reset +
                  pal.border + repeat_str(H, right) + TR + pal.reset);
  }
  int content_lines = std::max((int)lines.size(), min_height);
  for (int i = 0; i < content_lines; ++i) {
    std::string ln = (i < (int)lines.size()) ? lines[i] : std::string();
    out.push_back(pal.border + V + pal.reset + trunc_pad(ln, iw) + pal.reset + pal.border + V + pal.reset);
  }
  out.push_back(pal.border + BL + repeat_str(H, iw) + BR + pal.reset);
  return out;
}

// "LABEL  [####....] 42.0%"
static std::string pct_line(const std::string& label, double pct, int iw, const Palette& pal) {
  const int label_w = 6;
  std::string val = fixed1(pct) + "%";
  int barw = std::max(4, iw - label_w - 2 - 2 - 7);
  std::ostringstream os;
  os << trunc_pad(label, label_w) << " [" << pal.for_pct(pct) << bar(pct, barw, use_unicode()) << pal.reset
     << "] " << rpad_trunc(val, 6);
  return os.str();
}

static std::string history_line(const app::HistoryStore& h, const char* series, int iw, double max_value,
                                const Palette& pal) {
  const auto* hs = h.find(series);
  if (!hs || hs->empty()) return {};
  return pal.muted + sparkline(hs->values(), iw, max_value, use_unicode()) + pal.reset;
}

static std::string missing_line(const model::Unavailable& u, const Palette& pal) {
  std::string s = pal.muted + std::string(model::reason_label(u.reason));
  if (!u.detail.empty()) s += " (" + u.detail + ")";
  return s + pal.reset;
}

std::vector<std::string> render_cpu_panel(const model::SystemSnapshot& s, const app::HistoryStore& h,
                                          int width, const Palette& pal) {
  int iw = std::max(3, width - 2);
  std::vector<std::string> lines;
  if (!s.cpu) {
    lines.push_back(missing_line(s.cpu.error(), pal));
    return make_box("CPU", lines, width, pal, 1);
  }
  const auto& cpu = *s.cpu;
  lines.push_back(pct_line("CPU", cpu.usage_pct, iw, pal));
  if (auto spark = history_line(h, "cpu", iw, 100.0, pal); !spark.empty()) lines.push_back(spark);
  {
    auto temp = reading_text(cpu.temperature_c, [](double c){ return fixed1(c) + " C"; });
    auto power = reading_text(cpu.power_w, [](double w){ return fixed1(w) + " W"; });
    lines.push_back(lr_align(iw, "Temp " + temp, "Power " + power));
  }
  {
    auto load = reading_text(cpu.load_avg, [](const model::LoadAvg& la) {
      char buf[64];
      std::snprintf(buf, sizeof(buf), "%.2f %.2f %.2f", la.one, la.five, la.fifteen);
      return std::string(buf);
    });
    auto freq = reading_text(cpu.core_freq_mhz, [](const std::vector<double>& mhz) {
      return std::to_string(static_cast<long long>(collectors::mean_frequency_mhz(mhz) + 0.5)) + " MHz";
    });
    lines.push_back(lr_align(iw, "Load " + load, "Freq " + freq));
  }
  // Per-core usage, packed left to right
  std::string row;
  for (size_t i = 0; i < cpu.per_core_pct.size(); ++i) {
    std::ostringstream cell;
    cell << i << ":" << static_cast<int>(cpu.per_core_pct[i] + 0.5) << "% ";
    if (display_cols(row) + display_cols(cell.str()) > iw) {
      lines.push_back(row);
      row.clear();
      if (lines.size() >= 7) break;
    }
    row += cell.str();
  }
  if (!row.empty() && lines.size() < 7) lines.push_back(row);
  if (!cpu.model.empty())
    lines.push_back(pal.muted + sanitize_for_display(cpu.model) + " (" + std::to_string(cpu.logical_threads) + " threads)" + pal.reset);
  return make_box("CPU", lines, width, pal, 1);
}

std::vector<std::string> render_memory_panel(const model::SystemSnapshot& s, const app::HistoryStore& h,
                                             int width, const Palette& pal) {
  int iw = std::max(3, width - 2);
  std::vector<std::string> lines;
  if (!s.memory) {
    lines.push_back(missing_line(s.memory.error(), pal));
    return make_box("MEMORY", lines, width, pal, 1);
  }
  const auto& m = *s.memory;
  lines.push_back(pct_line("RAM", m.used_pct(), iw, pal));
  lines.push_back(lr_align(iw, "Used " + human_bytes(m.used), "Total " + human_bytes(m.total)));
  lines.push_back(lr_align(iw, "Cached " + human_bytes(m.cached), "Avail " + human_bytes(m.available)));
  if (m.swap_total > 0) {
    lines.push_back(pct_line("Swap", m.swap_pct(), iw, pal));
  } else {
    lines.push_back(pal.muted + "Swap   none" + pal.reset);
  }
  if (auto spark = history_line(h, "mem", iw, 100.0, pal); !spark.empty()) lines.push_back(spark);
  return make_box("MEMORY", lines, width, pal, 1);
}

std::vector<std::string> render_network_panel(const model::SystemSnapshot& s, const app::HistoryStore& h,
                                              int width, const Palette& pal) {
  int iw = std::max(3, width - 2);
  std::vector<std::string> lines;
  if (!s.network) {
    lines.push_back(missing_line(s.network.error(), pal));
    return make_box("NETWORK", lines, width, pal, 1);
  }
  const auto& n = *s.network;
  std::string which = n.active_index ? sanitize_for_display(n.interfaces[*n.active_index].name) : std::string("all");
  lines.push_back(lr_align(iw, "Interface " + which, pal.muted + "[i] cycle" + pal.reset));
  lines.push_back(lr_align(iw, "RX " + human_rate(n.rx_bps()), "TX " + human_rate(n.tx_bps())));
  const auto* rx = h.find("net.rx");
  const auto* tx = h.find("net.tx");
  double peak = 1.0;
  if (rx) for (double v : rx->values()) peak = std::max(peak, v);
  if (tx) for (double v : tx->values()) peak = std::max(peak, v);
  if (auto spark = history_line(h, "net.rx", iw, peak, pal); !spark.empty()) lines.push_back(spark);
  if (auto spark = history_line(h, "net.tx", iw, peak, pal); !spark.empty()) lines.push_back(spark);
  if (!n.active_index) {
    for (const auto& nif : n.interfaces) {
      lines.push_back(lr_align(iw, sanitize_for_display(nif.name), human_rate(nif.rx_bps) + " / " + human_rate(nif.tx_bps)));
      if (lines.size() >= 8) break;
    }
  }
  return make_box("NETWORK", lines, width, pal, 1);
}

std::vector<std::string> render_disk_panel(const model::SystemSnapshot& s, int width, const Palette& pal, int max_mounts) {
  int iw = std::max(3, width - 2);
  std::vector<std::string> lines;
  if (!s.disks) {
    lines.push_back(missing_line(s.disks.error(), pal));
    return make_box("DISKS", lines, width, pal, 1);
  }
  int shown = 0;
  for (const auto& d : s.disks->mounts) {
    if (shown++ >= max_mounts) break;
    double pct = d.used_pct();
    std::string right = pal.for_pct(pct) + fixed1(pct) + "%" + pal.reset + " " +
                        human_bytes(d.used_bytes) + "/" + human_bytes(d.total_bytes);
    lines.push_back(lr_align(iw, sanitize_for_display(d.mountpoint), right));
  }
  if (lines.empty()) lines.push_back(pal.muted + "no filesystems" + pal.reset);
  return make_box("DISKS", lines, width, pal, 1);
}

std::vector<std::string> render_gpu_panel(const model::SystemSnapshot& s, const app::HistoryStore& h,
                                          int width, const Palette& pal) {
  int iw = std::max(3, width - 2);
  std::vector<std::string> lines;
  if (!s.gpu) {
    lines.push_back(missing_line(s.gpu.error(), pal));
    return make_box("GPU", lines, width, pal, 1);
  }
  for (size_t i = 0; i < s.gpu->devices.size(); ++i) {
    const auto& d = s.gpu->devices[i];
    lines.push_back(pal.text + std::string(model::vendor_label(d.vendor)) + " " + sanitize_for_display(d.name) + pal.reset);
    if (d.usage_pct) {
      lines.push_back(pct_line("Usage", *d.usage_pct, iw, pal));
      std::string series = "gpu." + std::to_string(i) + ".usage";
      if (auto spark = history_line(h, series.c_str(), iw, 100.0, pal); !spark.empty()) lines.push_back(spark);
    } else {
      lines.push_back("Usage  " + missing_line(d.usage_pct.error(), pal));
    }
    auto temp = reading_text(d.temperature_c, [](double c){ return fixed1(c) + " C"; });
    auto power = reading_text(d.power_w, [](double w){ return fixed1(w) + " W"; });
    lines.push_back(lr_align(iw, "Temp " + temp, "Power " + power));
    std::string mem;
    if (d.mem_used_bytes && d.mem_total_bytes) {
      mem = human_bytes(*d.mem_used_bytes) + " / " + human_bytes(*d.mem_total_bytes);
    } else if (d.mem_used_bytes) {
      mem = human_bytes(*d.mem_used_bytes);
    } else {
      mem = std::string(model::reason_label(d.mem_used_bytes.error().reason));
    }
    lines.push_back(d.mem_label + " " + mem);
  }
  return make_box("GPU", lines, width, pal, 1);
}

std::vector<std::string> render_right_column(const model::SystemSnapshot& s, const app::HistoryStore& h,
                                             int width, int target_rows, const Palette& pal) {
  std::vector<std::string> out;
  auto add = [&](const std::vector<std::string>& box) {
    if ((int)(out.size() + box.size()) > target_rows) return;
    out.insert(out.end(), box.begin(), box.end());
  };
  add(render_cpu_panel(s, h, width, pal));
  add(render_memory_panel(s, h, width, pal));
  add(render_gpu_panel(s, h, width, pal));
  add(render_network_panel(s, h, width, pal));
  int left = target_rows - (int)out.size();
  if (left >= 3) add(render_disk_panel(s, width, pal, std::max(1, left - 2)));
  return out;
}

} // namespace rtop::ui
