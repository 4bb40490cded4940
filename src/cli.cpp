#include "cli.hpp"

#include <atomic>
#include <csignal>

namespace {
std::atomic<bool> g_stop{false};
static_assert(std::atomic<bool>::is_always_lock_free, "stop flag must be lock-free");

void on_stop_signal(int) { g_stop.store(true); }
}  // namespace

void register_cli_options(CLI::App& app, CliOptions& opts) {
  app.add_option("-c,--config", opts.config_path, "Configuration file path")
      ->check(CLI::ExistingFile);
  app.add_option("-p,--port", opts.port, "HTTP port (overrides config)")
      ->check(CLI::Range(1, 65535));
  app.add_flag("-v,--version", opts.show_version, "Show version information");
}

void install_stop_handlers() {
  std::signal(SIGINT, on_stop_signal);
  std::signal(SIGTERM, on_stop_signal);
}

bool stop_requested() { return g_stop.load(); }

void clear_stop_request() { g_stop.store(false); }
