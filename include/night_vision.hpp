#pragma once
#include <mutex>
#include <string>

#include <opencv2/core.hpp>

#include "types.hpp"

struct NightVisionConfig {
  bool enabled{true};
  bool auto_mode{true};
  bool green_mode{false};
  double strength{0.5};         // [0.1, 1.0]
  double light_threshold{50.0}; // [10, 150], smoothed luminance
  int debounce_ms{3000};
};

struct NightVisionState {
  bool enabled{true};
  bool auto_mode{true};
  bool active{false};
  bool manual_active{true};
  bool green_mode{false};
  double strength{0.5};
  double light_threshold{50.0};
  TimePoint last_change{};
};

enum class NightVisionMode { Disabled, AutoStandard, AutoNight, ManualOn, ManualOff };

const char* to_string(NightVisionMode m);

// Scene brightness over the centered quarter patch, smoothed 0.95 old / 0.05 new.
// Written by the capture loop, read by /status.
class LowLightDetector {
public:
  double measure(const cv::Mat& bgr);
  bool is_low_light(double threshold) const;
  double brightness() const;
  bool seeded() const;

private:
  mutable std::mutex mu_;
  double smoothed_{0.0};
  bool seeded_{false};
};

class NightVision {
public:
  explicit NightVision(const NightVisionConfig& cfg = NightVisionConfig{});

  // Feed the latest low-light detection. Returns true when `active` flipped.
  bool update(bool low_light, TimePoint now);

  bool toggle_enabled();
  bool toggle_auto_mode();
  bool toggle_green_mode();
  void set_manual_active(bool on);

  // Throw ValidationError when out of range.
  void set_strength(double s);
  void set_light_threshold(double t);

  NightVisionState snapshot() const;
  NightVisionMode mode() const;
  bool active() const;

  static constexpr double kMinStrength = 0.1;
  static constexpr double kMaxStrength = 1.0;
  static constexpr double kMinThreshold = 10.0;
  static constexpr double kMaxThreshold = 150.0;

private:
  void apply_locked(bool active, TimePoint now, const char* why);
  void sync_manual_locked(TimePoint now);
  NightVisionMode mode_locked() const;

  mutable std::mutex mu_;
  NightVisionState st_;
  std::chrono::milliseconds debounce_;
};
