#include "minitest.hpp"
#include "app/ThemeStore.hpp"
#include "util/TomlReader.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace rtop::app;

static std::filesystem::path scratch_dir(const char* tag) {
  auto p = std::filesystem::temp_directory_path() /
           ("rtop_theme_" + std::string(tag) + "_" + std::to_string(::getpid()));
  std::error_code ec;
  std::filesystem::remove_all(p, ec);
  return p;
}

TEST(theme_cycle_visits_every_theme) {
  Theme t = Theme::Default;
  const Theme order[] = {Theme::Dark, Theme::Nord, Theme::SolarizedDark, Theme::Gruvbox, Theme::Rtop, Theme::Default};
  for (Theme expect : order) {
    t = next_theme(t);
    ASSERT_TRUE(t == expect);
  }
}

TEST(theme_parse_current_and_retired_names) {
  for (Theme t : {Theme::Default, Theme::Dark, Theme::Nord, Theme::SolarizedDark, Theme::Gruvbox, Theme::Rtop})
    ASSERT_TRUE(parse_theme(theme_name(t)) == t);
  ASSERT_TRUE(parse_theme("light") == Theme::Default);
  ASSERT_TRUE(parse_theme("monochrome") == Theme::Dark);
  ASSERT_TRUE(parse_theme("solarized_light") == Theme::SolarizedDark);
  ASSERT_TRUE(parse_theme("  Solarized-Dark ") == Theme::SolarizedDark);
  ASSERT_TRUE(parse_theme("NORD") == Theme::Nord);
  ASSERT_TRUE(parse_theme("plaid") == Theme::Default);
}

TEST(theme_store_missing_file_loads_default) {
  auto dir = scratch_dir("missing");
  TomlThemeStore store((dir / "config.toml").string());
  ASSERT_TRUE(store.load() == Theme::Default);
}

TEST(theme_store_save_creates_directory_and_roundtrips) {
  auto dir = scratch_dir("save");
  auto path = dir / "nested" / "config.toml";
  TomlThemeStore store(path.string());
  ASSERT_TRUE(store.save(Theme::Gruvbox));
  ASSERT_TRUE(std::filesystem::exists(path));
  ASSERT_TRUE(store.load() == Theme::Gruvbox);
  ASSERT_TRUE(store.save(Theme::Nord));
  ASSERT_TRUE(TomlThemeStore(path.string()).load() == Theme::Nord);
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}

TEST(theme_store_save_preserves_other_keys) {
  auto dir = scratch_dir("preserve");
  std::filesystem::create_directories(dir);
  auto path = (dir / "config.toml").string();
  {
    std::ofstream f(path);
    f << "[sampling]\ninterval_ms = 750\n\n[ui]\ntheme = \"light\"\nalt_screen = false\n";
  }
  TomlThemeStore store(path);
  ASSERT_TRUE(store.load() == Theme::Default);
  ASSERT_TRUE(store.save(Theme::Rtop));
  rtop::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_int("sampling", "interval_ms", 0), 750);
  ASSERT_EQ(tr.get_bool("ui", "alt_screen", true), false);
  ASSERT_EQ(tr.get_string("ui", "theme"), std::string("rtop"));
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}

TEST(theme_store_empty_path_refuses_save) {
  TomlThemeStore store("");
  ASSERT_TRUE(!store.save(Theme::Dark));
  ASSERT_TRUE(store.load() == Theme::Default);
}

TEST(theme_store_falls_back_when_file_has_no_theme) {
  auto dir = scratch_dir("fallback");
  std::filesystem::create_directories(dir);
  auto path = (dir / "config.toml").string();
  ASSERT_TRUE(TomlThemeStore(path, Theme::Nord).load() == Theme::Nord);
  {
    std::ofstream f(path);
    f << "[sampling]\ninterval_ms = 750\n";
  }
  ASSERT_TRUE(TomlThemeStore(path, Theme::Gruvbox).load() == Theme::Gruvbox);
  {
    std::ofstream f(path);
    f << "[ui]\ntheme = \"dark\"\n";
  }
  ASSERT_TRUE(TomlThemeStore(path, Theme::Gruvbox).load() == Theme::Dark);
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}

TEST(theme_store_unreadable_file_is_not_overwritten) {
  // Root reads through mode bits
  if (::geteuid() == 0) return;
  auto dir = scratch_dir("unreadable");
  std::filesystem::create_directories(dir);
  auto path = (dir / "config.toml").string();
  {
    std::ofstream f(path);
    f << "[sampling]\ninterval_ms = 750\n";
  }
  std::filesystem::permissions(path, std::filesystem::perms::owner_write);
  TomlThemeStore store(path);
  ASSERT_TRUE(!store.save(Theme::Dark));
  std::filesystem::permissions(path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write);
  rtop::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_int("sampling", "interval_ms", 0), 750);
  ASSERT_TRUE(!tr.has("ui", "theme"));
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}
