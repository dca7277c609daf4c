#include "ui/Config.hpp"
#include "util/TomlReader.hpp"
#include <algorithm>
#include <cstdlib>
#include <string>

namespace rtop::ui {

// Accept both RTOP_FOO and rtop_FOO.
const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string n(name);
  std::string alt;
  if (n.rfind("RTOP_", 0) == 0) alt = "rtop_" + n.substr(5);
  else if (n.rfind("rtop_", 0) == 0) alt = "RTOP_" + n.substr(5);
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  try { return std::stoi(v); } catch (const std::exception&) { return defv; }
}

bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/rtop/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/rtop/config.toml";
  return {};
}

static int resolve_int(const rtop::util::TomlReader& toml, const char* section, const char* key,
                       const char* env_name, int def) {
  if (toml.has(section, key)) return toml.get_int(section, key, def);
  if (env_name) return getenv_int(env_name, def);
  return def;
}

static bool resolve_bool(const rtop::util::TomlReader& toml, const char* section, const char* key,
                         const char* env_name, bool def) {
  if (toml.has(section, key)) return toml.get_bool(section, key, def);
  if (env_name) return env_flag(env_name, def);
  return def;
}

static std::string resolve_string(const rtop::util::TomlReader& toml, const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (toml.has(section, key)) return toml.get_string(section, key, def);
  if (env_name) {
    if (const char* v = getenv_compat(env_name)) return std::string(v);
  }
  return def;
}

Config load_config(const std::string& path) {
  Config c{};
  rtop::util::TomlReader toml;
  if (!path.empty()) (void)toml.load(path); // missing file: every key falls through to env/default

  c.ui.alt_screen = resolve_bool(toml, "ui", "alt_screen", "RTOP_ALT_SCREEN", true);
  c.ui.refresh_ms = std::clamp(resolve_int(toml, "ui", "refresh_ms", "RTOP_REFRESH_MS", 250), 10, 1000);
  c.ui.theme      = resolve_string(toml, "ui", "theme", "RTOP_THEME", "default");

  c.sampling.interval_ms        = std::clamp(resolve_int(toml, "sampling", "interval_ms", "RTOP_INTERVAL_MS", 1000), 100, 60000);
  c.sampling.provider_budget_ms = std::max(1, resolve_int(toml, "sampling", "provider_budget_ms", "RTOP_PROVIDER_BUDGET_MS", 250));

  c.nvidia.disable_nvml = resolve_bool(toml, "nvidia", "disable_nvml", "RTOP_DISABLE_NVML", false);
  c.nvidia.nvml_path    = resolve_string(toml, "nvidia", "nvml_path", "RTOP_NVML_PATH", "");

  c.process.ema = resolve_bool(toml, "process", "ema", "RTOP_PROCESS_EMA", true);
  return c;
}

const Config& config() {
  static Config cfg = load_config(config_file_path());
  return cfg;
}

} // namespace rtop::ui
