#include "pipeline.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <thread>

using namespace std::chrono;

Pipeline::Pipeline(PipelineConfig cfg, FrameSource& source, Enhancer& enhancer,
                   LowLightDetector& light, NightVision& nv, ProcessingState& processing,
                   LatestFrameStore& store, EncodeCache& cache, FpsTracker& fps,
                   MetricsRegistry& metrics)
    : cfg_(cfg),
      source_(source),
      enhancer_(enhancer),
      light_(light),
      nv_(nv),
      processing_(processing),
      store_(store),
      cache_(cache),
      fps_(fps),
      metrics_(metrics) {}

Pipeline::~Pipeline() { stop(); }

bool Pipeline::step() {
  if (!source_.ready()) {
    if (state_.exchange(CaptureState::AwaitingCamera) == CaptureState::Capturing) {
      spdlog::warn("Camera lost, waiting for it to come back");
    }
    if (!source_.initialize()) {
      sleep_for(milliseconds(cfg_.camera_retry_ms));
      return false;
    }
    consecutive_failures_ = 0;
  }
  if (state_.exchange(CaptureState::Capturing) == CaptureState::AwaitingCamera) {
    spdlog::info("Capture loop running");
  }

  // The camera lock is held only inside capture(); enhancement and encoding run outside it.
  auto raw = source_.capture();
  if (!raw) {
    if (++consecutive_failures_ >= cfg_.max_capture_failures) {
      spdlog::error("{} consecutive capture failures, releasing camera", consecutive_failures_);
      source_.shutdown();
      consecutive_failures_ = 0;
      state_ = CaptureState::AwaitingCamera;
    }
    sleep_for(milliseconds(cfg_.capture_retry_ms));
    return false;
  }
  consecutive_failures_ = 0;
  return process(std::move(*raw));
}

bool Pipeline::process(RawFrame raw) {
  // Rejected frames must not feed the brightness average.
  if (!enhancer_.is_valid_frame(raw.image)) {
    metrics_.inc_invalid();
    return false;
  }

  const auto nv_before = nv_.snapshot();
  light_.measure(raw.image);
  nv_.update(light_.is_low_light(nv_before.light_threshold), raw.t_capture);

  const auto nv = nv_.snapshot();
  const auto pc = processing_.get();

  auto t0 = Clock::now();
  auto display = enhancer_.enhance(raw.image, pc, nv, fps_.stats());
  if (!display) {
    metrics_.inc_invalid();
    return false;
  }
  metrics_.add_enhance(ms_between(t0, Clock::now()));

  // Store publish happens-before cache publish for the same cycle.
  cv::Mat frame = std::move(*display);
  store_.publish(frame, raw.t_capture);
  fps_.tick(raw.t_capture);
  metrics_.inc_frame();
  return cache_.encode_and_cache(frame);
}

void Pipeline::start() {
  if (running_.exchange(true)) return;
  loop_thread_ = std::thread([this] {
    const auto period =
        duration<double, std::milli>(1000.0 / static_cast<double>(std::max(1, cfg_.target_fps)));
    spdlog::info("Capture loop starting (target {} fps)", cfg_.target_fps);

    while (running_) {
      auto t0 = Clock::now();
      try {
        step();
      } catch (const std::exception& e) {
        spdlog::error("Capture cycle failed: {}", e.what());
      }

      auto elapsed = Clock::now() - t0;
      auto to_sleep = duration_cast<milliseconds>(period - elapsed);
      if (to_sleep.count() > 0) {
        sleep_for(to_sleep);
      } else {
        std::this_thread::yield();
      }
    }
    spdlog::info("Capture loop stopped");
  });
}

void Pipeline::stop() {
  {
    std::lock_guard<std::mutex> g(wake_mu_);
    if (!running_.exchange(false)) return;
  }
  wake_.notify_all();
  if (loop_thread_.joinable()) loop_thread_.join();
}

void Pipeline::sleep_for(milliseconds d) {
  if (d.count() <= 0) return;
  std::unique_lock<std::mutex> lk(wake_mu_);
  if (running_) {
    wake_.wait_for(lk, d, [this] { return !running_.load(); });
  } else {
    lk.unlock();
    std::this_thread::sleep_for(d);
  }
}
