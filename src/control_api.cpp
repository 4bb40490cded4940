#include "control_api.hpp"

#include <spdlog/spdlog.h>

using nlohmann::json;

namespace {

json parse_object(const std::string& body) {
  json j;
  try {
    j = json::parse(body);
  } catch (const json::parse_error& e) {
    throw ValidationError(std::string("invalid JSON body: ") + e.what());
  }
  if (!j.is_object()) throw ValidationError("request body must be a JSON object");
  return j;
}

double number_field(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end()) throw ValidationError(std::string("missing field '") + key + "'");
  if (!it->is_number()) throw ValidationError(std::string("field '") + key + "' must be a number");
  return it->get<double>();
}

}  // namespace

StrengthRequest StrengthRequest::parse(const std::string& body) {
  StrengthRequest r;
  r.strength = number_field(parse_object(body), "strength");
  if (r.strength < NightVision::kMinStrength || r.strength > NightVision::kMaxStrength) {
    throw ValidationError("strength must be between 0.1 and 1.0");
  }
  return r;
}

ThresholdRequest ThresholdRequest::parse(const std::string& body) {
  ThresholdRequest r;
  r.threshold = number_field(parse_object(body), "threshold");
  if (r.threshold < NightVision::kMinThreshold || r.threshold > NightVision::kMaxThreshold) {
    throw ValidationError("threshold must be between 10 and 150");
  }
  return r;
}

ManualNightVisionRequest ManualNightVisionRequest::parse(const std::string& body) {
  json j = parse_object(body);
  auto it = j.find("active");
  if (it == j.end() || !it->is_boolean()) {
    throw ValidationError("field 'active' must be a boolean");
  }
  return ManualNightVisionRequest{it->get<bool>()};
}

ApiResult ControlApi::bad_request(const std::string& message) {
  return {400, json{{"success", false}, {"message", message}}};
}

ApiResult ControlApi::status() const {
  const auto fps = ctx_.fps.stats();
  const auto pc = ctx_.processing.get();
  const auto nv = ctx_.night_vision.snapshot();
  const double uptime = std::chrono::duration<double>(Clock::now() - ctx_.started).count();

  json j{{"active_clients", ctx_.broadcaster.active_clients()},
         {"max_clients", ctx_.broadcaster.max_clients()},
         {"fps", {{"current", fps.current}, {"min", fps.min}, {"max", fps.max}, {"avg", fps.avg}}},
         {"uptime", uptime},
         {"camera_status", ctx_.source.status()},
         {"reduce_processing", pc.reduce_processing},
         {"processing_level", pc.processing_level},
         {"night_vision",
          {{"enabled", nv.enabled},
           {"auto_mode", nv.auto_mode},
           {"active", nv.active},
           {"green_mode", nv.green_mode},
           {"strength", nv.strength},
           {"light_threshold", nv.light_threshold},
           {"mode", to_string(ctx_.night_vision.mode())},
           {"brightness", ctx_.light.brightness()}}}};
  return {200, j};
}

ApiResult ControlApi::reset_camera() {
  spdlog::info("Manual camera reset requested");
  ctx_.metrics.inc_reset();
  if (ctx_.source.reset()) {
    return {200, json{{"success", true}, {"message", "camera reset"}}};
  }
  return {500, json{{"success", false},
                    {"message", std::string("camera reset failed: ") +
                                    to_string(ctx_.source.last_error())}}};
}

ApiResult ControlApi::toggle_night_vision() {
  bool enabled = ctx_.night_vision.toggle_enabled();
  return {200, json{{"success", true}, {"enabled", enabled}}};
}

ApiResult ControlApi::toggle_night_vision_mode() {
  bool auto_mode = ctx_.night_vision.toggle_auto_mode();
  return {200, json{{"success", true}, {"auto_mode", auto_mode}}};
}

ApiResult ControlApi::toggle_green_night_vision() {
  bool green = ctx_.night_vision.toggle_green_mode();
  return {200, json{{"success", true}, {"green_mode", green}}};
}

ApiResult ControlApi::set_night_vision_manual(const std::string& body) {
  try {
    auto req = ManualNightVisionRequest::parse(body);
    ctx_.night_vision.set_manual_active(req.active);
    return {200, json{{"success", true}, {"manual_active", req.active}}};
  } catch (const ValidationError& e) {
    return bad_request(e.what());
  }
}

ApiResult ControlApi::set_night_vision_strength(const std::string& body) {
  try {
    auto req = StrengthRequest::parse(body);
    ctx_.night_vision.set_strength(req.strength);
    return {200, json{{"success", true}, {"strength", req.strength}}};
  } catch (const ValidationError& e) {
    return bad_request(e.what());
  }
}

ApiResult ControlApi::set_light_threshold(const std::string& body) {
  try {
    auto req = ThresholdRequest::parse(body);
    ctx_.night_vision.set_light_threshold(req.threshold);
    return {200, json{{"success", true}, {"threshold", req.threshold}}};
  } catch (const ValidationError& e) {
    return bad_request(e.what());
  }
}

std::string ControlApi::metrics_text() const {
  return ctx_.metrics.prometheus_text(ctx_.metrics.snapshot(ctx_.fps.stats()));
}

std::string ControlApi::index_html() const {
  return R"(<!DOCTYPE html>
<html>
<head><title>NightStream</title></head>
<body>
<h1>Camera Stream</h1>
<img src="/video_feed" width="640" height="480" />
<p><a href="/status">status</a> | <a href="/metrics">metrics</a></p>
</body>
</html>
)";
}
