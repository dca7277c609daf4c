#include "app/ThemeStore.hpp"
#include "util/AsciiLower.hpp"
#include "util/Log.hpp"
#include "util/TomlReader.hpp"
#include <filesystem>
#include <system_error>

namespace rtop::app {

Theme next_theme(Theme t) {
  switch (t) {
    case Theme::Default: return Theme::Dark;
    case Theme::Dark: return Theme::Nord;
    case Theme::Nord: return Theme::SolarizedDark;
    case Theme::SolarizedDark: return Theme::Gruvbox;
    case Theme::Gruvbox: return Theme::Rtop;
    case Theme::Rtop: return Theme::Default;
  }
  return Theme::Default;
}

std::string_view theme_name(Theme t) {
  switch (t) {
    case Theme::Default: return "default";
    case Theme::Dark: return "dark";
    case Theme::Nord: return "nord";
    case Theme::SolarizedDark: return "solarized_dark";
    case Theme::Gruvbox: return "gruvbox";
    case Theme::Rtop: return "rtop";
  }
  return "default";
}

Theme parse_theme(std::string_view name) {
  std::string n = rtop::util::to_lower(rtop::util::trim(name));
  for (auto& c : n) if (c == '-' || c == ' ') c = '_';
  if (n == "dark" || n == "monochrome") return Theme::Dark;
  if (n == "nord") return Theme::Nord;
  if (n == "solarized_dark" || n == "solarizeddark" || n == "solarized_light" || n == "solarizedlight") return Theme::SolarizedDark;
  if (n == "gruvbox") return Theme::Gruvbox;
  if (n == "rtop") return Theme::Rtop;
  return Theme::Default; // "default", "light" and unknown names
}

TomlThemeStore::TomlThemeStore(std::string path, Theme fallback)
  : path_(std::move(path)), fallback_(fallback) {}

Theme TomlThemeStore::load() {
  rtop::util::TomlReader toml;
  if (path_.empty() || !toml.load(path_) || !toml.has("ui", "theme")) return fallback_;
  return parse_theme(toml.get_string("ui", "theme"));
}

bool TomlThemeStore::save(Theme t) {
  if (path_.empty()) return false;
  std::error_code ec;
  auto dir = std::filesystem::path(path_).parent_path();
  if (!dir.empty()) std::filesystem::create_directories(dir, ec);
  if (ec) {
    rtop::util::log_once("theme:mkdir", "cannot create %s: %s", dir.c_str(), ec.message().c_str());
    return false;
  }
  // A missing file starts empty. An existing one that cannot be read is left alone.
  rtop::util::TomlReader toml;
  const bool present = std::filesystem::exists(path_, ec);
  if (ec || (present && !toml.load(path_))) {
    rtop::util::log_once("theme:read", "cannot read %s, theme not saved", path_.c_str());
    return false;
  }
  toml.set("ui", "theme", std::string(theme_name(t)));
  if (!toml.save(path_)) {
    rtop::util::log_once("theme:save", "cannot write %s", path_.c_str());
    return false;
  }
  return true;
}

} // namespace rtop::app
