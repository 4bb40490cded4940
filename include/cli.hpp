#pragma once
#include <CLI/CLI.hpp>
#include <string>

struct CliOptions {
  std::string config_path{"configs/config.yaml"};
  int port{0};
  bool show_version{false};
};

// -c must name an existing file when given; the default path may be absent.
void register_cli_options(CLI::App& app, CliOptions& opts);

// SIGINT/SIGTERM only raise a lock-free flag; a watcher thread acts on it.
void install_stop_handlers();
bool stop_requested();
void clear_stop_request();
