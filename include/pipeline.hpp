#pragma once
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "camera.hpp"
#include "controller.hpp"
#include "enhancer.hpp"
#include "frame_store.hpp"
#include "metrics.hpp"
#include "night_vision.hpp"
#include "types.hpp"

struct PipelineConfig {
  int target_fps{30};
  size_t fps_window{10};
  int jpeg_quality{80};
  int max_capture_failures{10};
  int camera_retry_ms{1000};
  int capture_retry_ms{100};
};

enum class CaptureState { AwaitingCamera, Capturing };

// The producer: camera -> enhancement -> frame store -> encode cache.
class Pipeline {
public:
  Pipeline(PipelineConfig cfg, FrameSource& source, Enhancer& enhancer, LowLightDetector& light,
           NightVision& nv, ProcessingState& processing, LatestFrameStore& store,
           EncodeCache& cache, FpsTracker& fps, MetricsRegistry& metrics);
  ~Pipeline();

  void start();  // Start processing loop in a background thread
  void stop();   // Stop and join thread
  bool running() const { return running_.load(); }
  CaptureState state() const { return state_.load(); }

  // One loop iteration without pacing; returns true when a frame reached the cache.
  bool step();

private:
  bool process(RawFrame raw);
  void sleep_for(std::chrono::milliseconds d);

  PipelineConfig cfg_;
  FrameSource& source_;
  Enhancer& enhancer_;
  LowLightDetector& light_;
  NightVision& nv_;
  ProcessingState& processing_;
  LatestFrameStore& store_;
  EncodeCache& cache_;
  FpsTracker& fps_;
  MetricsRegistry& metrics_;

  std::atomic<CaptureState> state_{CaptureState::AwaitingCamera};
  int consecutive_failures_{0};

  std::atomic<bool> running_{false};
  std::mutex wake_mu_;
  std::condition_variable wake_;
  std::thread loop_thread_;
};
