#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "broadcaster.hpp"
#include "camera.hpp"
#include "cli.hpp"
#include "control_api.hpp"
#include "controller.hpp"
#include "enhancer.hpp"
#include "frame_store.hpp"
#include "health_monitor.hpp"
#include "metrics.hpp"
#include "night_vision.hpp"
#include "pipeline.hpp"
#include "stream_server.hpp"
#include "util.hpp"

int main(int argc, char** argv) {
  CLI::App cli_app{"NightStream-RT: camera enhancement and multi-client MJPEG streaming server"};

  CliOptions opts;
  register_cli_options(cli_app, opts);

  try {
    cli_app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return cli_app.exit(e);
  }

  if (opts.show_version) {
    std::cout << "NightStream-RT v1.0.0" << std::endl;
    std::cout << "Adaptive camera enhancement with night vision and MJPEG broadcast" << std::endl;
    return 0;
  }

  spdlog::set_pattern("[%H:%M:%S.%e] %^[%l]%$ %v");

  AppConfig app{};
  if (std::filesystem::exists(opts.config_path)) {
    try {
      app = load_config(opts.config_path);
    } catch (const std::exception& e) {
      spdlog::error("Failed to load config '{}': {}", opts.config_path, e.what());
      return 1;
    }
    spdlog::info("NightStream-RT starting (config: {})", opts.config_path);
  } else {
    spdlog::warn("Config '{}' not found, using defaults", opts.config_path);
  }
  if (opts.port > 0) app.port = opts.port;
  apply_log_level(app.log_level);

  MetricsRegistry metrics;
  FrameSource source(app.camera, std::make_unique<OpenCvCameraDriver>());

  // Serving is meaningless without a source.
  if (!source.initialize()) {
    spdlog::error("Camera initialization failed at startup ({}). Exiting.",
                  to_string(source.last_error()));
    return 1;
  }

  LatestFrameStore store;
  EncodeCache cache(app.pipeline.jpeg_quality, 3, &metrics);
  FpsTracker fps(app.pipeline.fps_window);
  ProcessingState processing;
  NightVision night_vision(app.night_vision);
  LowLightDetector light;
  Enhancer enhancer(app.enhancer);
  Broadcaster broadcaster(app.stream, cache, processing, night_vision, &metrics);

  Pipeline pipe(app.pipeline, source, enhancer, light, night_vision, processing, store, cache, fps,
                metrics);
  ControllerLoop controller(Controller(app.controller), fps, night_vision, processing);
  HealthMonitor health(app.health, source, store, fps, processing, metrics,
                       [&broadcaster] { return broadcaster.active_clients(); });

  StreamContext ctx{source, store, cache, fps, processing, night_vision, light, broadcaster,
                    metrics};
  StreamServer server(ctx);
  install_stop_handlers();

  std::atomic<bool> done{false};
  std::thread stop_watcher([&] {
    while (!done.load()) {
      // Repeated until listen() returns; a stop issued before bind is a no-op.
      if (stop_requested()) server.stop();
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  });

  pipe.start();
  controller.start();
  health.start();

  const bool served = server.listen(app.host, app.port);
  if (stop_requested()) spdlog::info("Stop signal received");
  if (!served) {
    spdlog::error("HTTP server failed on {}:{}", app.host, app.port);
  }

  done = true;
  stop_watcher.join();
  health.stop();
  controller.stop();
  pipe.stop();
  source.shutdown();
  spdlog::info("Shutdown complete.");
  return served ? 0 : 1;
}
