#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <opencv2/videoio.hpp>

#include "types.hpp"

struct CameraConfig {
  std::string uri{"0"};  // device index ("0", "1", ...) or a URI / file path
  int width{640};
  int height{480};
  int fps{30};

  int warmup_frames{8};  // discarded after start so auto-exposure settles
  int init_attempts{3};
  int retry_backoff_ms{2000};
  int reset_cooldown_ms{2000};

  // Image controls; negative leaves the driver default.
  double brightness{-1};
  double contrast{-1};
  double saturation{-1};
  double sharpness{-1};
  double gain{-1};
  double exposure{-1};
};

// A started camera. Destroying the handle stops the device.
class CameraHandle {
public:
  virtual ~CameraHandle() = default;
  virtual bool capture(cv::Mat& out) = 0;
  virtual void stop() = 0;
};

class CameraDriver {
public:
  virtual ~CameraDriver() = default;
  // Returns nullptr when the device cannot be opened/configured/started.
  virtual std::unique_ptr<CameraHandle> open(const CameraConfig& cfg) = 0;
};

class OpenCvCameraHandle : public CameraHandle {
public:
  OpenCvCameraHandle() = default;
  ~OpenCvCameraHandle() override { stop(); }

  bool capture(cv::Mat& out) override;
  void stop() override;
  cv::VideoCapture& device() { return cap_; }

private:
  cv::VideoCapture cap_;
};

class OpenCvCameraDriver : public CameraDriver {
public:
  std::unique_ptr<CameraHandle> open(const CameraConfig& cfg) override;
};

// Owns the camera lifecycle: retried initialization, warm-up, capture and reset.
// All driver access is serialized on one mutex.
class FrameSource {
public:
  FrameSource(CameraConfig cfg, std::unique_ptr<CameraDriver> driver);
  ~FrameSource();

  bool initialize();
  std::optional<RawFrame> capture();
  bool reset();
  void shutdown();

  bool ready() const { return ready_.load(); }
  std::string status() const { return ready() ? "running" : "unavailable"; }
  CameraError last_error() const;
  const CameraConfig& config() const { return cfg_; }

private:
  bool initialize_locked();
  void release_locked();

  CameraConfig cfg_;
  std::unique_ptr<CameraDriver> driver_;

  mutable std::mutex camera_mu_;
  std::unique_ptr<CameraHandle> handle_;
  std::atomic<bool> ready_{false};
  CameraError last_error_{CameraError::None};
};
