#pragma once
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

#include "metrics.hpp"
#include "night_vision.hpp"
#include "types.hpp"

struct AdaptiveProfile {
  int adjust_interval_ms{3000};

  // Standard mode target window
  double min_fps{25.0};
  double max_fps{30.0};
  double severe_ratio{0.7};  // below min_fps * ratio also reduces processing

  // Night vision mode
  double night_min_fps{18.0};
  double night_critical_fps{16.0};
  double night_recover_fps{22.0};
};

struct ProcessingPlan {
  ProcessingConfig config{};
  std::string reason;
  bool changed{false};
};

// ProcessingConfig behind its own lock. Written by the controller loop only.
class ProcessingState {
public:
  explicit ProcessingState(ProcessingConfig initial = ProcessingConfig{}) : cfg_(initial) {}
  ProcessingConfig get() const {
    std::lock_guard<std::mutex> g(mu_);
    return cfg_;
  }
  void set(const ProcessingConfig& c) {
    std::lock_guard<std::mutex> g(mu_);
    cfg_ = c;
  }

private:
  mutable std::mutex mu_;
  ProcessingConfig cfg_;
};

class Controller {
public:
  explicit Controller(AdaptiveProfile p) : p_(p) {}
  // Moves the processing level by at most one step per call.
  ProcessingPlan decide(double fps, bool night_active, const ProcessingConfig& cur) const;
  const AdaptiveProfile& profile() const { return p_; }

  static constexpr int kMinLevel = 0;
  static constexpr int kMaxLevel = 2;

private:
  ProcessingPlan decide_night(double fps, const ProcessingConfig& cur) const;
  ProcessingPlan decide_standard(double fps, const ProcessingConfig& cur) const;

  AdaptiveProfile p_;
};

// Periodically feeds measured fps into the Controller and applies the plan.
class ControllerLoop {
public:
  ControllerLoop(Controller ctl, FpsTracker& fps, NightVision& nv, ProcessingState& state);
  ~ControllerLoop();

  void start();
  void stop();
  bool running() const { return running_.load(); }

  // One adjustment cycle; returns true when the config changed.
  bool step();

private:
  Controller ctl_;
  FpsTracker& fps_;
  NightVision& nv_;
  ProcessingState& state_;

  std::atomic<bool> running_{false};
  std::mutex wake_mu_;
  std::condition_variable wake_;
  std::thread thread_;
};
