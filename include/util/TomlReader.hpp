#pragma once

#include <cctype>
#include <fstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rtop::util {

// Reader/writer for the flat TOML subset used by config.toml:
// [section] headers and key = value lines with bare, integer, boolean or
// double-quoted string values. Order of sections and keys is preserved on save.
class TomlReader {
public:
  bool load(const std::string& path) {
    sections_.clear();
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::string section;
    std::string line;
    while (std::getline(in, line)) {
      auto sv = trim(strip_comment(line));
      if (sv.empty()) continue;
      if (sv.front() == '[') {
        if (sv.back() != ']') continue;
        section = std::string(trim(sv.substr(1, sv.size() - 2)));
        table(section);
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos) continue;
      auto key = trim(sv.substr(0, eq));
      if (key.empty()) continue;
      table(section).put(std::string(key), unquote(trim(sv.substr(eq + 1))));
    }
    return true;
  }

  bool save(const std::string& path) const {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) return false;
    bool first = true;
    for (const auto& [name, t] : sections_) {
      if (t.entries.empty() && name.empty()) continue;
      if (!first) out << '\n';
      first = false;
      if (!name.empty()) out << '[' << name << "]\n";
      for (const auto& [k, v] : t.entries) out << k << " = " << render(v) << '\n';
    }
    out.flush();
    return out.good();
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                       const std::string& def = "") const {
    const auto* v = lookup(section, key);
    return v ? *v : def;
  }

  [[nodiscard]] int get_int(std::string_view section, std::string_view key, int def = 0) const {
    const auto* v = lookup(section, key);
    if (!v || v->empty()) return def;
    try { return std::stoi(*v); } catch (const std::exception&) { return def; }
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    const auto* v = lookup(section, key);
    if (!v) return def;
    std::string s;
    for (char c : *v) s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (s == "true" || s == "1" || s == "yes") return true;
    if (s == "false" || s == "0" || s == "no") return false;
    return def;
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    return lookup(section, key) != nullptr;
  }

  void set(const std::string& section, const std::string& key, const std::string& value) { table(section).put(key, value); }
  void set(const std::string& section, const std::string& key, const char* value) { table(section).put(key, value); }
  void set(const std::string& section, const std::string& key, int value) { table(section).put(key, std::to_string(value)); }
  void set(const std::string& section, const std::string& key, bool value) { table(section).put(key, value ? "true" : "false"); }

private:
  struct Table {
    std::vector<std::pair<std::string, std::string>> entries;
    void put(const std::string& key, std::string val) {
      for (auto& [k, v] : entries) if (k == key) { v = std::move(val); return; }
      entries.emplace_back(key, std::move(val));
    }
  };

  std::vector<std::pair<std::string, Table>> sections_;

  Table& table(const std::string& name) {
    for (auto& [n, t] : sections_) if (n == name) return t;
    return sections_.emplace_back(name, Table{}).second;
  }

  const std::string* lookup(std::string_view section, std::string_view key) const {
    for (const auto& [n, t] : sections_) {
      if (n != section) continue;
      for (const auto& [k, v] : t.entries) if (k == key) return &v;
    }
    return nullptr;
  }

  // Drop a trailing # comment that is not inside a quoted string.
  static std::string_view strip_comment(std::string_view sv) {
    bool quoted = false;
    for (size_t i = 0; i < sv.size(); ++i) {
      if (sv[i] == '"' && (i == 0 || sv[i - 1] != '\\')) quoted = !quoted;
      else if (sv[i] == '#' && !quoted) return sv.substr(0, i);
    }
    return sv;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }

  static std::string unquote(std::string_view sv) {
    if (sv.size() < 2 || sv.front() != '"' || sv.back() != '"') return std::string(sv);
    std::string out;
    for (size_t i = 1; i + 1 < sv.size(); ++i) {
      if (sv[i] == '\\' && i + 2 < sv.size()) { out.push_back(sv[++i]); continue; }
      out.push_back(sv[i]);
    }
    return out;
  }

  static bool is_bare(const std::string& v) {
    if (v == "true" || v == "false") return true;
    size_t i = (!v.empty() && v[0] == '-') ? 1 : 0;
    if (i >= v.size()) return false;
    for (; i < v.size(); ++i) if (!std::isdigit(static_cast<unsigned char>(v[i]))) return false;
    return true;
  }

  static std::string render(const std::string& v) {
    if (is_bare(v)) return v;
    std::string out = "\"";
    for (char c : v) { if (c == '"' || c == '\\') out.push_back('\\'); out.push_back(c); }
    out.push_back('"');
    return out;
  }
};

} // namespace rtop::util
