#pragma once
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <opencv2/core.hpp>

using Clock = std::chrono::steady_clock;
using TimePoint = std::chrono::time_point<Clock>;

struct RawFrame {
  cv::Mat image;  // BGR, width x height x 3
  TimePoint t_capture{};
};

struct ProcessingConfig {
  int processing_level{1};  // 0..2
  bool reduce_processing{false};
};

enum class CameraError { None, InitFailed, CaptureFailed, StopFailed };

inline const char* to_string(CameraError e) {
  switch (e) {
    case CameraError::None:          return "none";
    case CameraError::InitFailed:    return "init_failed";
    case CameraError::CaptureFailed: return "capture_failed";
    case CameraError::StopFailed:    return "stop_failed";
  }
  return "unknown";
}

// Bad parameters on a control endpoint; surfaced to the caller as HTTP 400.
class ValidationError : public std::invalid_argument {
public:
  explicit ValidationError(const std::string& what) : std::invalid_argument(what) {}
};

inline double ms_between(TimePoint a, TimePoint b) {
  return std::chrono::duration<double, std::milli>(b - a).count();
}
