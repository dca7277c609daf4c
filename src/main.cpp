#include "app/HistoryStore.hpp"
#include "app/Interaction.hpp"
#include "app/ProcessKiller.hpp"
#include "app/ProcessTable.hpp"
#include "app/TelemetryAggregator.hpp"
#include "app/ThemeStore.hpp"
#include "app/TickLoop.hpp"
#include "collectors/ProcessCollector.hpp"
#include "ui/Config.hpp"
#include "ui/Input.hpp"
#include "ui/Renderer.hpp"
#include "ui/Terminal.hpp"
#include "util/Log.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#ifndef RTOP_VERSION
#define RTOP_VERSION "0.1.0"
#endif

using namespace std::chrono_literals;

namespace {

struct Options {
  bool once{false};
  bool no_alt_screen{false};
  int interval_ms{0}; // 0 = from config
};

void print_usage() {
  std::cout << "Usage: rtop [--interval MS] [--no-alt-screen] [--once] [--version]\n"
            << "  --interval MS      sampling interval in milliseconds (100..60000)\n"
            << "  --no-alt-screen    draw on the normal screen buffer\n"
            << "  --once             print one frame and exit\n"
            << "Config: " << rtop::ui::config_file_path() << "\n";
}

// Returns an exit code when the program should stop right away.
std::optional<int> parse_args(int argc, char** argv, Options& opt) {
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "-h" || a == "--help") { print_usage(); return 0; }
    if (a == "--version") { std::cout << "rtop " << RTOP_VERSION << "\n"; return 0; }
    if (a == "--once") { opt.once = true; continue; }
    if (a == "--no-alt-screen") { opt.no_alt_screen = true; continue; }
    if (a == "--interval" && i + 1 < argc) {
      char* end = nullptr;
      long v = std::strtol(argv[++i], &end, 10);
      if (!end || *end != '\0' || v < 100 || v > 60000) {
        std::fprintf(stderr, "rtop: --interval expects 100..60000, got '%s'\n", argv[i]);
        return 2;
      }
      opt.interval_ms = static_cast<int>(v);
      continue;
    }
    std::fprintf(stderr, "rtop: unknown argument '%s'\n", a.c_str());
    print_usage();
    return 2;
  }
  return std::nullopt;
}

int run(const Options& opt) {
  using namespace rtop;
  const auto& cfg = ui::config();

  auto telemetry = app::TelemetryAggregator::with_system_providers(
      std::chrono::milliseconds(cfg.sampling.provider_budget_ms));
  collectors::ProcessCollector proc_source;
  if (!proc_source.init()) util::log_once("proc.init", "process scanner unavailable");
  app::SignalKiller killer;
  app::ProcessTable processes(proc_source, killer, cfg.process.ema);
  app::HistoryStore history;
  app::InteractionMachine machine;
  app::TomlThemeStore themes(ui::config_file_path(), app::parse_theme(cfg.ui.theme));

  app::ViewState view;
  view.theme = themes.load();
  view.page_rows = static_cast<size_t>(std::max(1, ui::term_rows() - 4));

  app::TickConfig tick_cfg;
  tick_cfg.sample_interval = std::chrono::milliseconds(opt.interval_ms > 0 ? opt.interval_ms : cfg.sampling.interval_ms);
  tick_cfg.refresh = std::chrono::milliseconds(cfg.ui.refresh_ms);

  ui::TerminalInput input;
  ui::TerminalRenderer renderer(!opt.once);
  app::TickLoop loop(telemetry, processes, history, machine, view, themes, input, renderer, tick_cfg);

  if (opt.once) {
    // Rates and CPU% need two samples
    loop.sample_now();
    std::this_thread::sleep_for(std::min<std::chrono::milliseconds>(tick_cfg.sample_interval, 1000ms));
    loop.sample_now();
    app::Frame frame{loop.snapshot(), history, loop.rows(), machine.state(), view, processes.entries().size()};
    renderer.present(frame);
    return 0;
  }

  const bool use_alt = cfg.ui.alt_screen && !opt.no_alt_screen && ui::tty_stdout();
  util::set_fallback_log_file(util::default_log_file_path());
  ui::RawTermGuard raw{};
  ui::CursorGuard cursor{};
  ui::AltScreenGuard alt{use_alt};
  loop.run(&ui::g_stop);
  util::set_fallback_log_file({});
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  Options opt;
  if (auto rc = parse_args(argc, argv, opt)) return *rc;
  rtop::ui::install_signal_handlers();
  try {
    return run(opt);
  } catch (const std::logic_error& e) {
    rtop::ui::restore_terminal_minimal();
    std::fprintf(stderr, "rtop: fatal: %s\n", e.what());
    return 1;
  } catch (const std::exception& e) {
    rtop::ui::restore_terminal_minimal();
    std::fprintf(stderr, "rtop: error: %s\n", e.what());
    return 1;
  }
}
