#include "util.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

AppConfig load_config(const std::string& path) {
  YAML::Node y = YAML::LoadFile(path);
  AppConfig c{};

  if (y["camera"]) {
    auto n = y["camera"];
    if (n["uri"]) c.camera.uri = n["uri"].as<std::string>();
    if (n["width"]) c.camera.width = n["width"].as<int>();
    if (n["height"]) c.camera.height = n["height"].as<int>();
    if (n["fps"]) c.camera.fps = n["fps"].as<int>();
    if (n["warmup_frames"]) c.camera.warmup_frames = n["warmup_frames"].as<int>();
    if (n["init_attempts"]) c.camera.init_attempts = n["init_attempts"].as<int>();
    if (n["retry_backoff_ms"]) c.camera.retry_backoff_ms = n["retry_backoff_ms"].as<int>();
    if (n["reset_cooldown_ms"]) c.camera.reset_cooldown_ms = n["reset_cooldown_ms"].as<int>();
    if (n["brightness"]) c.camera.brightness = n["brightness"].as<double>();
    if (n["contrast"]) c.camera.contrast = n["contrast"].as<double>();
    if (n["saturation"]) c.camera.saturation = n["saturation"].as<double>();
    if (n["sharpness"]) c.camera.sharpness = n["sharpness"].as<double>();
    if (n["gain"]) c.camera.gain = n["gain"].as<double>();
    if (n["exposure"]) c.camera.exposure = n["exposure"].as<double>();
  }
  if (y["pipeline"]) {
    auto n = y["pipeline"];
    if (n["target_fps"]) c.pipeline.target_fps = n["target_fps"].as<int>();
    if (n["fps_window"]) c.pipeline.fps_window = n["fps_window"].as<size_t>();
    if (n["jpeg_quality"]) c.pipeline.jpeg_quality = n["jpeg_quality"].as<int>();
    if (n["max_capture_failures"])
      c.pipeline.max_capture_failures = n["max_capture_failures"].as<int>();
  }
  if (y["enhancer"]) {
    auto n = y["enhancer"];
    if (n["red_gain"]) c.enhancer.red_gain = n["red_gain"].as<double>();
    if (n["green_gain"]) c.enhancer.green_gain = n["green_gain"].as<double>();
    if (n["blue_gain"]) c.enhancer.blue_gain = n["blue_gain"].as<double>();
    if (n["brightness_lift"]) c.enhancer.brightness_lift = n["brightness_lift"].as<double>();
  }
  if (y["stream"]) {
    auto n = y["stream"];
    if (n["max_clients"]) c.stream.max_clients = n["max_clients"].as<int>();
    if (n["stream_fps"]) c.stream.stream_fps = n["stream_fps"].as<int>();
    if (n["reduced_stream_fps"]) c.stream.reduced_stream_fps = n["reduced_stream_fps"].as<int>();
  }
  if (y["controller"]) {
    auto n = y["controller"];
    if (n["adjust_interval_ms"]) c.controller.adjust_interval_ms = n["adjust_interval_ms"].as<int>();
    if (n["min_fps"]) c.controller.min_fps = n["min_fps"].as<double>();
    if (n["max_fps"]) c.controller.max_fps = n["max_fps"].as<double>();
    if (n["severe_ratio"]) c.controller.severe_ratio = n["severe_ratio"].as<double>();
    if (n["night_min_fps"]) c.controller.night_min_fps = n["night_min_fps"].as<double>();
    if (n["night_critical_fps"])
      c.controller.night_critical_fps = n["night_critical_fps"].as<double>();
    if (n["night_recover_fps"])
      c.controller.night_recover_fps = n["night_recover_fps"].as<double>();
  }
  if (y["health"]) {
    auto n = y["health"];
    if (n["check_interval_ms"]) c.health.check_interval_ms = n["check_interval_ms"].as<int>();
    if (n["frame_timeout_ms"]) c.health.frame_timeout_ms = n["frame_timeout_ms"].as<int>();
  }
  if (y["night_vision"]) {
    auto n = y["night_vision"];
    if (n["enabled"]) c.night_vision.enabled = n["enabled"].as<bool>();
    if (n["auto_mode"]) c.night_vision.auto_mode = n["auto_mode"].as<bool>();
    if (n["green_mode"]) c.night_vision.green_mode = n["green_mode"].as<bool>();
    if (n["strength"]) c.night_vision.strength = n["strength"].as<double>();
    if (n["light_threshold"]) c.night_vision.light_threshold = n["light_threshold"].as<double>();
    if (n["debounce_ms"]) c.night_vision.debounce_ms = n["debounce_ms"].as<int>();
  }
  if (y["server"]) {
    if (y["server"]["host"]) c.host = y["server"]["host"].as<std::string>();
    if (y["server"]["port"]) c.port = y["server"]["port"].as<int>();
  }
  if (y["logging"] && y["logging"]["level"]) c.log_level = y["logging"]["level"].as<std::string>();

  return c;
}

void apply_log_level(const std::string& level) {
  if (level == "debug") {
    spdlog::set_level(spdlog::level::debug);
  } else if (level == "info") {
    spdlog::set_level(spdlog::level::info);
  } else if (level == "warn") {
    spdlog::set_level(spdlog::level::warn);
  } else if (level == "error") {
    spdlog::set_level(spdlog::level::err);
  }
}
