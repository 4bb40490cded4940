#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

#include "camera.hpp"
#include "controller.hpp"
#include "frame_store.hpp"
#include "metrics.hpp"

struct HealthConfig {
  int check_interval_ms{30000};
  int frame_timeout_ms{5000};
};

// Watchdog: resets the camera when no frame has been published within the timeout.
class HealthMonitor {
public:
  using ClientCount = std::function<int()>;

  HealthMonitor(HealthConfig cfg, FrameSource& source, const LatestFrameStore& store,
                const FpsTracker& fps, const ProcessingState& processing, MetricsRegistry& metrics,
                ClientCount clients = {});
  ~HealthMonitor();

  void start();
  void stop();
  bool running() const { return running_.load(); }

  // Returns true when a camera reset was triggered.
  bool check(TimePoint now);

  bool is_stale(TimePoint now) const;

private:
  HealthConfig cfg_;
  FrameSource& source_;
  const LatestFrameStore& store_;
  const FpsTracker& fps_;
  const ProcessingState& processing_;
  MetricsRegistry& metrics_;
  ClientCount clients_;

  std::atomic<bool> running_{false};
  std::mutex wake_mu_;
  std::condition_variable wake_;
  std::thread thread_;
};
