#include "controller.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

ProcessingPlan Controller::decide(double fps, bool night_active,
                                  const ProcessingConfig& cur) const {
  ProcessingPlan plan = night_active ? decide_night(fps, cur) : decide_standard(fps, cur);
  plan.config.processing_level = std::clamp(plan.config.processing_level, kMinLevel, kMaxLevel);
  plan.changed = plan.config.processing_level != cur.processing_level ||
                 plan.config.reduce_processing != cur.reduce_processing;
  return plan;
}

ProcessingPlan Controller::decide_night(double fps, const ProcessingConfig& cur) const {
  ProcessingPlan plan{cur, "no-change"};
  if (fps < p_.night_critical_fps) {
    // Heading for level 0, one step per cycle.
    plan.config.processing_level = std::max(kMinLevel, cur.processing_level - 1);
    plan.config.reduce_processing = true;
    plan.reason = "night fps critical";
  } else if (fps < p_.night_min_fps) {
    plan.config.processing_level = std::max(kMinLevel, cur.processing_level - 1);
    plan.reason = "night fps below target";
  } else if (fps > p_.night_recover_fps && cur.reduce_processing) {
    plan.config.reduce_processing = false;
    plan.reason = "night fps recovered";
  }
  return plan;
}

ProcessingPlan Controller::decide_standard(double fps, const ProcessingConfig& cur) const {
  ProcessingPlan plan{cur, "no-change"};
  if (fps < p_.min_fps) {
    plan.config.processing_level = std::max(kMinLevel, cur.processing_level - 1);
    plan.reason = "fps below target";
    if (fps < p_.min_fps * p_.severe_ratio) {
      plan.config.reduce_processing = true;
      plan.reason = "fps far below target";
    }
  } else if (fps > p_.max_fps) {
    if (cur.reduce_processing) {
      plan.config.reduce_processing = false;
      plan.reason = "fps above target, restoring processing";
    } else {
      plan.config.processing_level = std::min(kMaxLevel, cur.processing_level + 1);
      plan.reason = "fps above target";
    }
  }
  return plan;
}

ControllerLoop::ControllerLoop(Controller ctl, FpsTracker& fps, NightVision& nv,
                               ProcessingState& state)
    : ctl_(ctl), fps_(fps), nv_(nv), state_(state) {}

ControllerLoop::~ControllerLoop() { stop(); }

bool ControllerLoop::step() {
  const double fps = fps_.stats().current;
  if (fps <= 0.0) return false;  // nothing measured yet

  const ProcessingConfig cur = state_.get();
  ProcessingPlan plan = ctl_.decide(fps, nv_.active(), cur);
  if (!plan.changed) return false;

  state_.set(plan.config);
  spdlog::info("Processing adjusted ({}): fps={:.1f} level {}->{} reduce {}->{}", plan.reason, fps,
               cur.processing_level, plan.config.processing_level, cur.reduce_processing,
               plan.config.reduce_processing);
  return true;
}

void ControllerLoop::start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread([this] {
    const auto period = std::chrono::milliseconds(std::max(1, ctl_.profile().adjust_interval_ms));
    while (running_) {
      {
        std::unique_lock<std::mutex> lk(wake_mu_);
        wake_.wait_for(lk, period, [this] { return !running_.load(); });
      }
      if (!running_) break;
      try {
        step();
      } catch (const std::exception& e) {
        spdlog::error("Performance controller cycle failed: {}", e.what());
      }
    }
  });
}

void ControllerLoop::stop() {
  {
    std::lock_guard<std::mutex> g(wake_mu_);
    if (!running_.exchange(false)) return;
  }
  wake_.notify_all();
  if (thread_.joinable()) thread_.join();
}
