#pragma once

#include <string>

namespace rtop::ui {

// Runtime configuration, resolved per key as TOML -> RTOP_* env -> default.
struct Config {
  struct {
    bool alt_screen{true};
    int refresh_ms{250};          // upper bound on the input wait per tick
    std::string theme{"default"};
  } ui;
  struct {
    int interval_ms{1000};        // telemetry/process sampling cadence
    int provider_budget_ms{250};  // per-provider time budget inside one sample
  } sampling;
  struct {
    bool disable_nvml{false};
    std::string nvml_path;
  } nvidia;
  struct {
    bool ema{true};               // smooth per-process CPU%
  } process;
};

// Process-wide configuration, loaded once from config_file_path().
const Config& config();

// Load from an explicit file (missing file = defaults + env). Does not cache.
Config load_config(const std::string& path);

// $XDG_CONFIG_HOME/rtop/config.toml, else ~/.config/rtop/config.toml; empty if neither is set.
std::string config_file_path();

// Environment variable helpers
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);
bool env_flag(const char* name, bool defv);

} // namespace rtop::ui
