#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "broadcaster.hpp"
#include "camera.hpp"
#include "controller.hpp"
#include "frame_store.hpp"
#include "metrics.hpp"
#include "night_vision.hpp"
#include "types.hpp"

// Shared components handed to the HTTP layer. Everything is owned by main.
struct StreamContext {
  FrameSource& source;
  LatestFrameStore& store;
  EncodeCache& cache;
  FpsTracker& fps;
  ProcessingState& processing;
  NightVision& night_vision;
  LowLightDetector& light;
  Broadcaster& broadcaster;
  MetricsRegistry& metrics;
  TimePoint started{Clock::now()};
};

// Control payloads, decoded and range-checked once at the boundary.
// parse() throws ValidationError on malformed bodies.
struct StrengthRequest {
  double strength{};
  static StrengthRequest parse(const std::string& body);
};

struct ThresholdRequest {
  double threshold{};
  static ThresholdRequest parse(const std::string& body);
};

struct ManualNightVisionRequest {
  bool active{};
  static ManualNightVisionRequest parse(const std::string& body);
};

struct ApiResult {
  int status{200};
  nlohmann::json body;
};

class ControlApi {
public:
  explicit ControlApi(StreamContext& ctx) : ctx_(ctx) {}

  ApiResult status() const;
  ApiResult reset_camera();
  ApiResult toggle_night_vision();
  ApiResult toggle_night_vision_mode();
  ApiResult toggle_green_night_vision();
  ApiResult set_night_vision_manual(const std::string& body);
  ApiResult set_night_vision_strength(const std::string& body);
  ApiResult set_light_threshold(const std::string& body);

  std::string metrics_text() const;
  std::string index_html() const;

private:
  static ApiResult bad_request(const std::string& message);

  StreamContext& ctx_;
};
