#pragma once

#include "model/Availability.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace rtop::ui {

// UTF-8 text width utilities
int u8_len(unsigned char c);
int display_cols(const std::string& s);
std::string take_cols(const std::string& s, int cols);

// Replaces control bytes (C0, DEL, C1, ESC) and malformed UTF-8 with '?'.
// Apply to any text that comes from other processes before it is drawn.
std::string sanitize_for_display(const std::string& s);

// Text formatting and alignment
std::string trunc_pad(const std::string& s, int w);
std::string rpad_trunc(const std::string& s, int w);
std::string lr_align(int iw, const std::string& left, const std::string& right);

// Quantities
std::string human_bytes(uint64_t bytes);
std::string human_rate(double bytes_per_sec);
std::string fixed1(double v);

// Renders a reading with fmt, or the short label for why it is missing.
template <class T, class Fmt>
std::string reading_text(const model::Reading<T>& r, Fmt&& fmt) {
  if (r) return fmt(*r);
  return std::string(model::reason_label(r.error().reason));
}

// Fill bar for a 0..100 percentage, `width` cells wide.
std::string bar(double pct, int width, bool unicode);
// Last `width` values as a block sparkline scaled to [0, max_value].
std::string sparkline(const std::vector<double>& values, int width, double max_value, bool unicode);

// Header helpers
std::string format_time_now();
std::string read_hostname();
std::string read_uptime_formatted();

} // namespace rtop::ui
