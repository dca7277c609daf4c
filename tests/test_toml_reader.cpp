#include "minitest.hpp"
#include "util/TomlReader.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

static std::string tmp_path(const char* suffix) {
  return std::string("/tmp/rtop_test_toml_") + suffix + ".toml";
}

static void write_file(const std::string& path, const std::string& content) {
  std::ofstream f(path);
  f << content;
}

static void remove_file(const std::string& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

TEST(toml_load_missing_file) {
  rtop::util::TomlReader tr;
  ASSERT_TRUE(!tr.load("/tmp/rtop_test_toml_nonexistent_file.toml"));
}

TEST(toml_load_basic) {
  auto path = tmp_path("basic");
  write_file(path,
    "[ui]\n"
    "alt_screen = true\n"
    "theme = \"nord\"\n"
    "\n"
    "[sampling]\n"
    "interval_ms = 500\n"
    "provider_budget_ms = 80\n"
  );
  rtop::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_bool("ui", "alt_screen", false), true);
  ASSERT_EQ(tr.get_string("ui", "theme"), "nord");
  ASSERT_EQ(tr.get_int("sampling", "interval_ms"), 500);
  ASSERT_EQ(tr.get_int("sampling", "provider_budget_ms"), 80);
  remove_file(path);
}

TEST(toml_defaults_for_missing_keys) {
  auto path = tmp_path("defaults");
  write_file(path, "[ui]\nalt_screen = true\n");
  rtop::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_string("ui", "missing_key", "fallback"), "fallback");
  ASSERT_EQ(tr.get_int("ui", "missing_int", 42), 42);
  ASSERT_EQ(tr.get_bool("ui", "missing_bool", true), true);
  // Missing section entirely
  ASSERT_EQ(tr.get_string("nosection", "key", "nope"), "nope");
  ASSERT_EQ(tr.get_int("nosection", "key", -1), -1);
  remove_file(path);
}

TEST(toml_has) {
  auto path = tmp_path("has");
  write_file(path, "[nvidia]\ndisable_nvml = true\n");
  rtop::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_TRUE(tr.has("nvidia", "disable_nvml"));
  ASSERT_TRUE(!tr.has("nvidia", "missing"));
  ASSERT_TRUE(!tr.has("nosection", "disable_nvml"));
  remove_file(path);
}

TEST(toml_bool_variants) {
  auto path = tmp_path("bool");
  write_file(path,
    "[b]\n"
    "a = true\n"
    "b = True\n"
    "c = TRUE\n"
    "d = 1\n"
    "e = false\n"
    "f = False\n"
    "g = FALSE\n"
    "h = 0\n"
    "i = junk\n"
    "j = yes\n"
  );
  rtop::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_bool("b", "a"), true);
  ASSERT_EQ(tr.get_bool("b", "b"), true);
  ASSERT_EQ(tr.get_bool("b", "c"), true);
  ASSERT_EQ(tr.get_bool("b", "d"), true);
  ASSERT_EQ(tr.get_bool("b", "e"), false);
  ASSERT_EQ(tr.get_bool("b", "f"), false);
  ASSERT_EQ(tr.get_bool("b", "g"), false);
  ASSERT_EQ(tr.get_bool("b", "h"), false);
  ASSERT_EQ(tr.get_bool("b", "j"), true);
  // "junk" -> returns default
  ASSERT_EQ(tr.get_bool("b", "i", true), true);
  ASSERT_EQ(tr.get_bool("b", "i", false), false);
  remove_file(path);
}

TEST(toml_int_coercion) {
  auto path = tmp_path("int");
  write_file(path,
    "[n]\n"
    "pos = 42\n"
    "neg = -7\n"
    "zero = 0\n"
    "str = hello\n"
  );
  rtop::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_int("n", "pos"), 42);
  ASSERT_EQ(tr.get_int("n", "neg"), -7);
  ASSERT_EQ(tr.get_int("n", "zero"), 0);
  // non-numeric string returns default
  ASSERT_EQ(tr.get_int("n", "str", 99), 99);
  remove_file(path);
}

TEST(toml_quoted_strings) {
  auto path = tmp_path("quoted");
  write_file(path,
    "[s]\n"
    "plain = hello\n"
    "quoted = \"world\"\n"
    "empty = \"\"\n"
    "hex = \"#FF00AA\"\n"
    "path = \"/usr/lib/x86_64-linux-gnu/libnvidia-ml.so.1\" # trailing comment\n"
  );
  rtop::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_string("s", "plain"), "hello");
  ASSERT_EQ(tr.get_string("s", "quoted"), "world");
  ASSERT_EQ(tr.get_string("s", "empty"), "");
  ASSERT_EQ(tr.get_string("s", "hex"), "#FF00AA");
  ASSERT_EQ(tr.get_string("s", "path"), "/usr/lib/x86_64-linux-gnu/libnvidia-ml.so.1");
  remove_file(path);
}

TEST(toml_comments_and_whitespace) {
  auto path = tmp_path("comments");
  write_file(path,
    "# Top-level comment\n"
    "\n"
    "[ ui ]  \n"
    "  key1  =  val1  \n"
    "# inline section comment\n"
    "  key2 = 10\n"
  );
  rtop::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_string("ui", "key1"), "val1");
  ASSERT_EQ(tr.get_int("ui", "key2"), 10);
  remove_file(path);
}

TEST(toml_set_and_overwrite) {
  rtop::util::TomlReader tr;
  tr.set("ui", "alt_screen", true);
  tr.set("ui", "refresh_ms", 250);
  tr.set("ui", "theme", "gruvbox");
  ASSERT_EQ(tr.get_bool("ui", "alt_screen"), true);
  ASSERT_EQ(tr.get_int("ui", "refresh_ms"), 250);
  ASSERT_EQ(tr.get_string("ui", "theme"), "gruvbox");
  // Overwrite
  tr.set("ui", "refresh_ms", 100);
  ASSERT_EQ(tr.get_int("ui", "refresh_ms"), 100);
}

TEST(toml_roundtrip) {
  auto path = tmp_path("roundtrip");
  rtop::util::TomlReader tr;
  tr.set("ui", "theme", std::string("solarized_dark"));
  tr.set("ui", "alt_screen", false);
  tr.set("sampling", "interval_ms", 2000);
  tr.set("nvidia", "nvml_path", std::string("/usr/lib/libnvidia-ml.so.1"));
  tr.set("process", "note", std::string("say \"hi\" # not a comment"));
  ASSERT_TRUE(tr.save(path));

  rtop::util::TomlReader tr2;
  ASSERT_TRUE(tr2.load(path));
  ASSERT_EQ(tr2.get_string("ui", "theme"), "solarized_dark");
  ASSERT_EQ(tr2.get_bool("ui", "alt_screen", true), false);
  ASSERT_EQ(tr2.get_int("sampling", "interval_ms"), 2000);
  ASSERT_EQ(tr2.get_string("nvidia", "nvml_path"), "/usr/lib/libnvidia-ml.so.1");
  ASSERT_EQ(tr2.get_string("process", "note"), "say \"hi\" # not a comment");
  remove_file(path);
}

TEST(toml_global_keys_no_section) {
  auto path = tmp_path("global");
  write_file(path, "key = value\n[sec]\nother = 1\n");
  rtop::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  // Keys before any [section] go under empty-string section
  ASSERT_EQ(tr.get_string("", "key"), "value");
  ASSERT_EQ(tr.get_int("sec", "other"), 1);
  remove_file(path);
}
