#include "night_vision.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <opencv2/imgproc.hpp>

const char* to_string(NightVisionMode m) {
  switch (m) {
    case NightVisionMode::Disabled:     return "disabled";
    case NightVisionMode::AutoStandard: return "auto_standard";
    case NightVisionMode::AutoNight:    return "auto_night";
    case NightVisionMode::ManualOn:     return "manual_on";
    case NightVisionMode::ManualOff:    return "manual_off";
  }
  return "unknown";
}

double LowLightDetector::measure(const cv::Mat& bgr) {
  if (bgr.empty()) return brightness();
  const int side = std::max(1, std::min(bgr.rows, bgr.cols) / 4);
  cv::Rect roi((bgr.cols - side) / 2, (bgr.rows - side) / 2, side, side);

  cv::Mat gray;
  if (bgr.channels() == 3) {
    cv::cvtColor(bgr(roi), gray, cv::COLOR_BGR2GRAY);
  } else {
    gray = bgr(roi);
  }
  const double sample = cv::mean(gray)[0];

  std::lock_guard<std::mutex> g(mu_);
  if (!seeded_) {
    smoothed_ = sample;
    seeded_ = true;
  } else {
    smoothed_ = 0.95 * smoothed_ + 0.05 * sample;
  }
  return smoothed_;
}

bool LowLightDetector::is_low_light(double threshold) const {
  std::lock_guard<std::mutex> g(mu_);
  return seeded_ && smoothed_ < threshold;
}

double LowLightDetector::brightness() const {
  std::lock_guard<std::mutex> g(mu_);
  return smoothed_;
}

bool LowLightDetector::seeded() const {
  std::lock_guard<std::mutex> g(mu_);
  return seeded_;
}

NightVision::NightVision(const NightVisionConfig& cfg)
    : debounce_(std::chrono::milliseconds(std::max(0, cfg.debounce_ms))) {
  st_.enabled = cfg.enabled;
  st_.auto_mode = cfg.auto_mode;
  st_.green_mode = cfg.green_mode;
  st_.strength = std::clamp(cfg.strength, kMinStrength, kMaxStrength);
  st_.light_threshold = std::clamp(cfg.light_threshold, kMinThreshold, kMaxThreshold);
  st_.last_change = Clock::now() - debounce_;
  sync_manual_locked(Clock::now());
}

bool NightVision::update(bool low_light, TimePoint now) {
  std::lock_guard<std::mutex> g(mu_);
  const bool before = st_.active;

  if (!st_.enabled) {
    if (st_.active) apply_locked(false, now, "disabled");
  } else if (!st_.auto_mode) {
    sync_manual_locked(now);
  } else if (low_light != st_.active && now - st_.last_change > debounce_) {
    apply_locked(low_light, now, low_light ? "low light detected" : "light restored");
  }
  return st_.active != before;
}

bool NightVision::toggle_enabled() {
  std::lock_guard<std::mutex> g(mu_);
  st_.enabled = !st_.enabled;
  spdlog::info("Night vision {}", st_.enabled ? "enabled" : "disabled");
  auto now = Clock::now();
  if (!st_.enabled) {
    apply_locked(false, now, "disabled");
  } else {
    sync_manual_locked(now);
  }
  return st_.enabled;
}

bool NightVision::toggle_auto_mode() {
  std::lock_guard<std::mutex> g(mu_);
  st_.auto_mode = !st_.auto_mode;
  spdlog::info("Night vision mode: {}", st_.auto_mode ? "auto" : "manual");
  sync_manual_locked(Clock::now());
  return st_.auto_mode;
}

bool NightVision::toggle_green_mode() {
  std::lock_guard<std::mutex> g(mu_);
  st_.green_mode = !st_.green_mode;
  spdlog::info("Green night vision {}", st_.green_mode ? "on" : "off");
  return st_.green_mode;
}

void NightVision::set_manual_active(bool on) {
  std::lock_guard<std::mutex> g(mu_);
  st_.manual_active = on;
  sync_manual_locked(Clock::now());
}

void NightVision::set_strength(double s) {
  if (!(s >= kMinStrength && s <= kMaxStrength)) {
    throw ValidationError("strength must be between 0.1 and 1.0");
  }
  std::lock_guard<std::mutex> g(mu_);
  st_.strength = s;
  spdlog::info("Night vision strength set to {:.2f}", s);
}

void NightVision::set_light_threshold(double t) {
  if (!(t >= kMinThreshold && t <= kMaxThreshold)) {
    throw ValidationError("threshold must be between 10 and 150");
  }
  std::lock_guard<std::mutex> g(mu_);
  st_.light_threshold = t;
  spdlog::info("Night vision light threshold set to {:.1f}", t);
}

NightVisionState NightVision::snapshot() const {
  std::lock_guard<std::mutex> g(mu_);
  return st_;
}

NightVisionMode NightVision::mode() const {
  std::lock_guard<std::mutex> g(mu_);
  return mode_locked();
}

bool NightVision::active() const {
  std::lock_guard<std::mutex> g(mu_);
  return st_.active;
}

NightVisionMode NightVision::mode_locked() const {
  if (!st_.enabled) return NightVisionMode::Disabled;
  if (st_.auto_mode) return st_.active ? NightVisionMode::AutoNight : NightVisionMode::AutoStandard;
  return st_.active ? NightVisionMode::ManualOn : NightVisionMode::ManualOff;
}

// Manual mode follows the manual flag with no debounce.
void NightVision::sync_manual_locked(TimePoint now) {
  if (!st_.enabled || st_.auto_mode) return;
  if (st_.active != st_.manual_active) apply_locked(st_.manual_active, now, "manual");
}

void NightVision::apply_locked(bool active, TimePoint now, const char* why) {
  if (st_.active == active) return;
  st_.active = active;
  st_.last_change = now;
  spdlog::info("Night vision {} ({}) -> {}", active ? "activated" : "deactivated", why,
               to_string(mode_locked()));
}
