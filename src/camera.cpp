#include "camera.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <thread>

namespace {

bool is_device_index(const std::string& uri) {
  if (uri.empty()) return false;
  for (char c : uri) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

void apply_control(cv::VideoCapture& cap, int prop, double value, const char* name) {
  if (value < 0) return;
  if (!cap.set(prop, value)) {
    spdlog::debug("Camera ignored control {}={}", name, value);
  }
}

}  // namespace

bool OpenCvCameraHandle::capture(cv::Mat& out) {
  if (!cap_.isOpened()) return false;
  if (!cap_.read(out)) return false;
  return !out.empty();
}

void OpenCvCameraHandle::stop() {
  if (cap_.isOpened()) cap_.release();
}

std::unique_ptr<CameraHandle> OpenCvCameraDriver::open(const CameraConfig& cfg) {
  auto handle = std::make_unique<OpenCvCameraHandle>();
  cv::VideoCapture& cap = handle->device();
  bool ok = is_device_index(cfg.uri) ? cap.open(std::stoi(cfg.uri)) : cap.open(cfg.uri);
  if (!ok || !cap.isOpened()) {
    spdlog::error("Failed to open camera '{}'", cfg.uri);
    return nullptr;
  }

  if (is_device_index(cfg.uri)) {
    cap.set(cv::CAP_PROP_FOURCC, cv::VideoWriter::fourcc('M', 'J', 'P', 'G'));
  }
  cap.set(cv::CAP_PROP_FRAME_WIDTH, cfg.width);
  cap.set(cv::CAP_PROP_FRAME_HEIGHT, cfg.height);
  cap.set(cv::CAP_PROP_FPS, cfg.fps);
  cap.set(cv::CAP_PROP_BUFFERSIZE, 1);

  apply_control(cap, cv::CAP_PROP_BRIGHTNESS, cfg.brightness, "brightness");
  apply_control(cap, cv::CAP_PROP_CONTRAST, cfg.contrast, "contrast");
  apply_control(cap, cv::CAP_PROP_SATURATION, cfg.saturation, "saturation");
  apply_control(cap, cv::CAP_PROP_SHARPNESS, cfg.sharpness, "sharpness");
  apply_control(cap, cv::CAP_PROP_GAIN, cfg.gain, "gain");
  apply_control(cap, cv::CAP_PROP_EXPOSURE, cfg.exposure, "exposure");

  spdlog::info("Opened camera '{}' ({}x{} @ ~{} fps)", cfg.uri,
               static_cast<int>(cap.get(cv::CAP_PROP_FRAME_WIDTH)),
               static_cast<int>(cap.get(cv::CAP_PROP_FRAME_HEIGHT)), cap.get(cv::CAP_PROP_FPS));
  return handle;
}

FrameSource::FrameSource(CameraConfig cfg, std::unique_ptr<CameraDriver> driver)
    : cfg_(std::move(cfg)), driver_(std::move(driver)) {}

FrameSource::~FrameSource() { shutdown(); }

bool FrameSource::initialize() {
  std::lock_guard<std::mutex> g(camera_mu_);
  if (handle_) return true;
  return initialize_locked();
}

bool FrameSource::initialize_locked() {
  const int attempts = std::max(1, cfg_.init_attempts);
  for (int attempt = 1; attempt <= attempts; ++attempt) {
    spdlog::info("Initializing camera (attempt {}/{})", attempt, attempts);
    try {
      auto h = driver_->open(cfg_);
      if (h) {
        cv::Mat discard;
        int discarded = 0;
        for (int i = 0; i < cfg_.warmup_frames; ++i) {
          if (h->capture(discard)) discarded++;
        }
        spdlog::info("Camera ready ({} warm-up frames discarded)", discarded);
        handle_ = std::move(h);
        last_error_ = CameraError::None;
        ready_ = true;
        return true;
      }
    } catch (const std::exception& e) {
      spdlog::error("Camera initialization threw: {}", e.what());
    }
    if (attempt < attempts && cfg_.retry_backoff_ms > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(cfg_.retry_backoff_ms));
    }
  }
  spdlog::error("Camera initialization failed after {} attempts", attempts);
  last_error_ = CameraError::InitFailed;
  ready_ = false;
  return false;
}

std::optional<RawFrame> FrameSource::capture() {
  std::lock_guard<std::mutex> g(camera_mu_);
  if (!handle_) return std::nullopt;
  RawFrame f;
  bool ok = false;
  try {
    ok = handle_->capture(f.image);
  } catch (const std::exception& e) {
    spdlog::warn("Camera capture threw: {}", e.what());
  }
  if (!ok || f.image.empty()) {
    last_error_ = CameraError::CaptureFailed;
    return std::nullopt;
  }
  f.t_capture = Clock::now();
  return f;
}

bool FrameSource::reset() {
  std::lock_guard<std::mutex> g(camera_mu_);
  spdlog::warn("Resetting camera");
  release_locked();
  if (cfg_.reset_cooldown_ms > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(cfg_.reset_cooldown_ms));
  }
  bool ok = initialize_locked();
  if (ok) {
    spdlog::info("Camera reset complete");
  } else {
    spdlog::error("Camera reset failed: {}", to_string(last_error_));
  }
  return ok;
}

void FrameSource::shutdown() {
  std::lock_guard<std::mutex> g(camera_mu_);
  if (handle_) spdlog::info("Stopping camera");
  release_locked();
}

// Caller holds camera_mu_.
void FrameSource::release_locked() {
  ready_ = false;
  if (!handle_) return;
  try {
    handle_->stop();
  } catch (const std::exception& e) {
    last_error_ = CameraError::StopFailed;
    spdlog::warn("Camera stop threw: {}", e.what());
  }
  handle_.reset();
}

CameraError FrameSource::last_error() const {
  std::lock_guard<std::mutex> g(camera_mu_);
  return last_error_;
}
