#pragma once
#include <string>
#include <string_view>

namespace rtop::app {

enum class Theme { Default, Dark, Nord, SolarizedDark, Gruvbox, Rtop };

// Default -> Dark -> Nord -> SolarizedDark -> Gruvbox -> Rtop -> Default
[[nodiscard]] Theme next_theme(Theme t);
[[nodiscard]] std::string_view theme_name(Theme t);

// Accepts current names and the retired ones (light, monochrome,
// solarized_light); anything unknown is Default.
[[nodiscard]] Theme parse_theme(std::string_view name);

// Where the selected theme lives between runs.
class IThemeStore {
public:
  virtual ~IThemeStore() = default;
  virtual Theme load() = 0;
  virtual bool save(Theme t) = 0;
};

// [ui] theme in config.toml. Other keys in the file are preserved on save.
class TomlThemeStore : public IThemeStore {
public:
  // `fallback` is returned when the file or its [ui] theme key is missing.
  explicit TomlThemeStore(std::string path, Theme fallback = Theme::Default);
  Theme load() override;
  bool save(Theme t) override;
  const std::string& path() const { return path_; }

private:
  std::string path_;
  Theme fallback_;
};

} // namespace rtop::app
