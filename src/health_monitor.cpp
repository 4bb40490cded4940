#include "health_monitor.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

HealthMonitor::HealthMonitor(HealthConfig cfg, FrameSource& source, const LatestFrameStore& store,
                             const FpsTracker& fps, const ProcessingState& processing,
                             MetricsRegistry& metrics, ClientCount clients)
    : cfg_(cfg),
      source_(source),
      store_(store),
      fps_(fps),
      processing_(processing),
      metrics_(metrics),
      clients_(std::move(clients)) {}

HealthMonitor::~HealthMonitor() { stop(); }

bool HealthMonitor::is_stale(TimePoint now) const {
  return now - store_.last_frame_time() > std::chrono::milliseconds(cfg_.frame_timeout_ms);
}

bool HealthMonitor::check(TimePoint now) {
  const auto fps = fps_.stats();
  const auto pc = processing_.get();
  spdlog::info("Status: clients={} fps={:.1f} (min {:.1f} max {:.1f}) camera={} level={}{}",
               clients_ ? clients_() : 0, fps.current, fps.min, fps.max, source_.status(),
               pc.processing_level, pc.reduce_processing ? " reduced" : "");

  if (!is_stale(now)) return false;

  spdlog::warn("No new frame for {:.1f}s, resetting camera",
               ms_between(store_.last_frame_time(), now) / 1000.0);
  metrics_.inc_reset();
  if (!source_.reset()) {
    spdlog::error("Watchdog camera reset failed; capture loop will keep retrying");
  }
  return true;
}

void HealthMonitor::start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread([this] {
    const auto period = std::chrono::milliseconds(std::max(1, cfg_.check_interval_ms));
    while (running_) {
      {
        std::unique_lock<std::mutex> lk(wake_mu_);
        wake_.wait_for(lk, period, [this] { return !running_.load(); });
      }
      if (!running_) break;
      try {
        check(Clock::now());
      } catch (const std::exception& e) {
        spdlog::error("Health check failed: {}", e.what());
      }
    }
  });
}

void HealthMonitor::stop() {
  {
    std::lock_guard<std::mutex> g(wake_mu_);
    if (!running_.exchange(false)) return;
  }
  wake_.notify_all();
  if (thread_.joinable()) thread_.join();
}
