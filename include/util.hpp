#pragma once
#include <string>

#include "broadcaster.hpp"
#include "camera.hpp"
#include "controller.hpp"
#include "enhancer.hpp"
#include "health_monitor.hpp"
#include "night_vision.hpp"
#include "pipeline.hpp"

struct AppConfig {
  CameraConfig camera;
  PipelineConfig pipeline;
  EnhancerConfig enhancer;
  StreamConfig stream;
  AdaptiveProfile controller;
  HealthConfig health;
  NightVisionConfig night_vision;
  std::string host{"0.0.0.0"};
  int port{8000};
  std::string log_level{"info"};
};

AppConfig load_config(const std::string& path);

// Maps "debug" / "info" / "warn" / "error" onto spdlog; unknown names keep the current level.
void apply_log_level(const std::string& level);
