#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"
#include "util/Procfs.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <sstream>

namespace rtop::ui {

int u8_len(unsigned char c){
  if (c < 0x80) return 1;
  if ((c >> 5) == 0x6) return 2;
  if ((c >> 4) == 0xE) return 3;
  if ((c >> 3) == 0x1E) return 4;
  return 1;
}

std::string sanitize_for_display(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size();) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    if (c < 0x80) {
      if (c == '\t') out += ' ';
      else if (c < 0x20 || c == 0x7F) out += '?';
      else out += static_cast<char>(c);
      ++i;
      continue;
    }
    int n = u8_len(c);
    bool ok = n > 1 && i + static_cast<size_t>(n) <= s.size();
    for (int k = 1; ok && k < n; ++k)
      ok = (static_cast<unsigned char>(s[i + k]) & 0xC0) == 0x80;
    // C1 controls arrive as U+0080..U+009F (C2 80..C2 9F)
    if (ok && n == 2 && c == 0xC2 && static_cast<unsigned char>(s[i + 1]) < 0xA0) ok = false;
    if (!ok) { out += '?'; ++i; continue; }
    out.append(s, i, static_cast<size_t>(n));
    i += static_cast<size_t>(n);
  }
  return out;
}

int display_cols(const std::string& s){
  int cols = 0;
  for (size_t i=0; i<s.size();){
    // Skip ANSI escape sequences
    if (s[i] == '\x1B' && i+1 < s.size() && s[i+1] == '[') {
      i += 2;
      while (i < s.size() && (s[i] < '@' || s[i] > '~')) i++;
      if (i < s.size()) i++;
      continue;
    }
    i += u8_len((unsigned char)s[i]);
    cols += 1;
  }
  return cols;
}

std::string take_cols(const std::string& s, int cols){
  if (cols <= 0) return std::string();
  std::string out;
  out.reserve(s.size());
  int seen = 0;
  size_t i = 0;
  while (i < s.size() && seen < cols) {
    // Copy ANSI escape sequences without counting them
    if (s[i] == '\x1B' && i+1 < s.size() && s[i+1] == '[') {
      size_t start = i;
      i += 2;
      while (i < s.size() && (s[i] < '@' || s[i] > '~')) i++;
      if (i < s.size()) i++;
      out.append(s, start, i - start);
      continue;
    }
    int len = u8_len((unsigned char)s[i]);
    if (i + (size_t)len > s.size()) len = 1;
    out.append(s, i, len);
    i += len;
    seen += 1;
  }
  return out;
}

std::string trunc_pad(const std::string& s, int w) {
  if (w <= 0) return "";
  int cols = display_cols(s);
  if (cols == w) return s;
  if (cols < w) return s + std::string(w - cols, ' ');
  if (w <= 1) return take_cols(s, w);
  return take_cols(s, w - 1) + (use_unicode()? "\xE2\x80\xA6" : ".");
}

std::string rpad_trunc(const std::string& s, int w) {
  if (w <= 0) return "";
  int cols = display_cols(s);
  if (cols == w) return s;
  if (cols < w) return std::string(w - cols, ' ') + s;
  return take_cols(s, w);
}

std::string lr_align(int iw, const std::string& left, const std::string& right){
  if (iw <= 0) return std::string();
  int rvis = display_cols(right);
  int tlw = iw - rvis - 1;
  if (tlw < 0) tlw = 0;
  std::string l = trunc_pad(left, tlw);
  int lvis = display_cols(l);
  int space = iw - lvis - rvis;
  if (space < 0) space = 0;
  return l + std::string(space, ' ') + right;
}

std::string human_bytes(uint64_t bytes) {
  static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB", "PiB"};
  double v = static_cast<double>(bytes);
  int u = 0;
  while (v >= 1024.0 && u < 5) { v /= 1024.0; ++u; }
  char buf[32];
  if (u == 0) std::snprintf(buf, sizeof(buf), "%llu B", static_cast<unsigned long long>(bytes));
  else std::snprintf(buf, sizeof(buf), "%.1f %s", v, units[u]);
  return buf;
}

std::string human_rate(double bytes_per_sec) {
  if (!(bytes_per_sec > 0.0)) return "0 B/s";
  return human_bytes(static_cast<uint64_t>(std::llround(bytes_per_sec))) + "/s";
}

std::string fixed1(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f", v);
  return buf;
}

std::string bar(double pct, int width, bool unicode) {
  if (width <= 0) return {};
  pct = std::clamp(pct, 0.0, 100.0);
  int fill = static_cast<int>(std::lround(pct / 100.0 * width));
  std::string out;
  for (int i = 0; i < width; ++i) {
    if (i < fill) out += unicode ? "\xE2\x96\x88" : "#";
    else out += unicode ? "\xE2\x96\x91" : ".";
  }
  return out;
}

std::string sparkline(const std::vector<double>& values, int width, double max_value, bool unicode) {
  static const char* blocks[] = {" ", "\xE2\x96\x81", "\xE2\x96\x82", "\xE2\x96\x83", "\xE2\x96\x84",
                                 "\xE2\x96\x85", "\xE2\x96\x86", "\xE2\x96\x87", "\xE2\x96\x88"};
  static const char ascii[] = " .:-=+*#@";
  if (width <= 0) return {};
  if (max_value <= 0.0) max_value = 1.0;
  std::string out;
  int pad = width - static_cast<int>(values.size());
  if (pad > 0) out.append(static_cast<size_t>(pad), ' ');
  size_t start = values.size() > static_cast<size_t>(width) ? values.size() - width : 0;
  for (size_t i = start; i < values.size(); ++i) {
    double f = std::clamp(values[i] / max_value, 0.0, 1.0);
    int level = static_cast<int>(std::lround(f * 8.0));
    if (unicode) out += blocks[level];
    else out += ascii[level];
  }
  return out;
}

std::string format_time_now() {
  std::time_t t = std::time(nullptr);
  std::tm lt{};
  localtime_r(&t, &lt);
  char buf[32];
  if (std::strftime(buf, sizeof(buf), "%H:%M:%S", &lt) == 0) return std::string();
  return buf;
}

std::string read_hostname() {
  auto txt = util::read_file_string("/proc/sys/kernel/hostname");
  if (!txt) return "unknown";
  std::string host = *txt;
  while (!host.empty() && (host.back() == '\n' || host.back() == '\r' || host.back() == ' '))
    host.pop_back();
  return host.empty() ? "unknown" : host;
}

std::string read_uptime_formatted() {
  auto txt = util::read_file_string("/proc/uptime");
  if (!txt) return "0d 00:00";
  std::istringstream ss(*txt);
  double uptime_seconds = 0.0;
  ss >> uptime_seconds;
  uint64_t total = static_cast<uint64_t>(uptime_seconds);
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%llud %02llu:%02llu",
                static_cast<unsigned long long>(total / 86400),
                static_cast<unsigned long long>((total % 86400) / 3600),
                static_cast<unsigned long long>((total % 3600) / 60));
  return buf;
}

} // namespace rtop::ui
