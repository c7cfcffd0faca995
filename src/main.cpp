#include "app/DashboardRefresher.hpp"
#include "app/EventLoop.hpp"
#include "app/InputDispatcher.hpp"
#include "app/ServiceMonitor.hpp"
#include "app/Clipboard.hpp"
#include "collectors/ProcfsSampleProvider.hpp"
#include "collectors/StorageProbe.hpp"
#include "ui/Config.hpp"
#include "ui/Input.hpp"
#include "ui/Renderer.hpp"
#include "ui/Terminal.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

using namespace devmon;

static void print_usage() {
  std::cout << "Usage: devmon [--config PATH] [--iterations N] [--sleep-ms MS] [-h|--help]\n";
  std::cout << "Notes: runs until Ctrl+C by default. Press 'e' to copy the last error from the log.\n";
}

int main(int argc, char** argv) {
  std::signal(SIGINT, ui::on_stop_signal);
  std::signal(SIGTERM, ui::on_stop_signal);
  // A clipboard command that dies early must not take the monitor with it
  std::signal(SIGPIPE, SIG_IGN);

  int iterations = 0; // 0 or less => run until Ctrl+C
  int sleep_ms = 0;   // 0 => take refresh_ms from config
  std::string config_path = ui::config_file_path();
  try {
    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];
      if (a == "--iterations" && i + 1 < argc) iterations = std::stoi(argv[++i]);
      else if (a == "--sleep-ms" && i + 1 < argc) sleep_ms = std::stoi(argv[++i]);
      else if (a == "--config" && i + 1 < argc) config_path = argv[++i];
      else if (a == "-h" || a == "--help") { print_usage(); return 0; }
      else {
        std::fprintf(stderr, "devmon: unknown or incomplete argument '%s'\n", a.c_str());
        print_usage();
        return 1;
      }
    }
  } catch (const std::exception& e) {
    std::fprintf(stderr, "devmon: invalid numeric argument (%s)\n", e.what());
    return 1;
  }

  ui::Config cfg = ui::load_config(config_path);
  if (sleep_ms > 0) cfg.ui.refresh_ms = std::clamp(sleep_ms, 100, 60000);
  const auto interval = std::chrono::milliseconds(cfg.ui.refresh_ms);

  std::fprintf(stderr, "devmon: watching %s (%zu services, refresh %dms, config %s)\n",
               cfg.log.path.c_str(), cfg.services.size(), cfg.ui.refresh_ms,
               cfg.source.empty() ? "defaults" : cfg.source.c_str());

  collectors::ProcfsSampleProvider provider;
  app::ServiceMonitor monitor(provider, cfg.services);
  app::DashboardRefresher refresher(monitor, collectors::StorageProbe(cfg.storage.db_path),
                                    cfg.log.path, static_cast<size_t>(cfg.log.tail_lines));
  app::CommandClipboard clipboard(cfg.clipboard.command);
  app::InputDispatcher dispatcher({cfg.log.path, cfg.log.error_dump, cfg.ui.debug},
                                  cfg.keybinds, clipboard);
  ui::TerminalKeySource keys;
  ui::FrameOptions frame_opts;
  frame_opts.title = cfg.ui.title;
  frame_opts.url = cfg.ui.url;
  frame_opts.refresh = interval;
  frame_opts.status_ttl = std::chrono::milliseconds(cfg.ui.status_ttl_ms);
  frame_opts.tail_lines = cfg.log.tail_lines;
  ui::TerminalRenderer renderer(frame_opts);
  app::EventLoop loop(keys, dispatcher, refresher, renderer, interval, cfg.ui.debug);

  uint64_t ticks = 0;
  std::optional<std::string> fatal;
  {
    ui::RawTermGuard raw{};
    if (raw.failed()) {
      std::fprintf(stderr, "devmon: could not put the terminal into raw non-blocking mode\n");
      return 1;
    }
    bool use_alt = cfg.ui.alt_screen && ui::tty_stdout();
    ui::CursorGuard curs{}; ui::AltScreenGuard alt{use_alt};
    std::atexit(&ui::on_atexit_restore);
    try {
      ticks = loop.run(ui::g_stop, iterations > 0 ? static_cast<uint64_t>(iterations) : 0);
    } catch (const std::exception& e) {
      fatal = e.what();
    }
  }

  // Guards have unwound here, so the message lands on the normal screen
  if (fatal) {
    std::fprintf(stderr, "devmon: stopped on error: %s\n", fatal->c_str());
    return 1;
  }
  std::fprintf(stderr, "devmon: %s after %llu ticks\n",
               ui::g_stop.load() ? "interrupted" : "finished",
               static_cast<unsigned long long>(ticks));
  return 0;
}
