#pragma once
#include <string>
#include <string_view>

namespace rtop::util {

constexpr char ascii_lower(unsigned char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : static_cast<char>(c);
}

inline std::string to_lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = ascii_lower(static_cast<unsigned char>(c));
  return out;
}

// Case-insensitive (ASCII) substring test; an empty needle always matches.
inline bool contains_ci(std::string_view hay, std::string_view needle) {
  if (needle.empty()) return true;
  if (needle.size() > hay.size()) return false;
  for (size_t i = 0; i + needle.size() <= hay.size(); ++i) {
    size_t j = 0;
    while (j < needle.size() &&
           ascii_lower(static_cast<unsigned char>(hay[i + j])) == ascii_lower(static_cast<unsigned char>(needle[j]))) ++j;
    if (j == needle.size()) return true;
  }
  return false;
}

// Three-way ASCII case-insensitive compare.
inline int compare_ci(std::string_view a, std::string_view b) {
  size_t n = a.size() < b.size() ? a.size() : b.size();
  for (size_t i = 0; i < n; ++i) {
    char x = ascii_lower(static_cast<unsigned char>(a[i]));
    char y = ascii_lower(static_cast<unsigned char>(b[i]));
    if (x != y) return x < y ? -1 : 1;
  }
  if (a.size() == b.size()) return 0;
  return a.size() < b.size() ? -1 : 1;
}

inline std::string_view trim(std::string_view sv) {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t' || sv.front() == '\n' || sv.front() == '\r')) sv.remove_prefix(1);
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\n' || sv.back() == '\r')) sv.remove_suffix(1);
  return sv;
}

} // namespace rtop::util
