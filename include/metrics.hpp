#pragma once
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "types.hpp"

class RollingHist {
public:
  explicit RollingHist(size_t cap = 512) : cap_(cap) {}
  void add(double x) {
    std::lock_guard<std::mutex> g(mu_);
    if (vals_.size() == cap_) vals_.pop_front();
    vals_.push_back(x);
  }
  // Percentile p in [0,100]
  double perc(double p) const {
    std::lock_guard<std::mutex> g(mu_);
    if (vals_.empty()) return 0.0;
    std::vector<double> v(vals_.begin(), vals_.end());
    std::sort(v.begin(), v.end());
    double rank = (p / 100.0) * static_cast<double>(v.size() - 1);
    size_t lo = static_cast<size_t>(rank);
    size_t hi = std::min(v.size() - 1, lo + 1);
    double frac = rank - static_cast<double>(lo);
    return v[lo] + (v[hi] - v[lo]) * frac;
  }
  size_t size() const {
    std::lock_guard<std::mutex> g(mu_);
    return vals_.size();
  }

private:
  size_t cap_;
  mutable std::mutex mu_;
  std::deque<double> vals_;
};

struct FpsStats {
  double current{0};
  double min{0};
  double max{0};
  double avg{0};
};

// Frame rate over a sliding window of the last N capture timestamps.
class FpsTracker {
public:
  explicit FpsTracker(size_t window = 10) : window_(std::max<size_t>(2, window)) {}

  void tick(TimePoint t);
  FpsStats stats() const;
  size_t samples() const;
  void reset();

private:
  void recompute();

  size_t window_;
  mutable std::mutex mu_;
  std::deque<TimePoint> stamps_;
  FpsStats stats_{};
};

struct StatSnapshot {
  double enhance_p50{0}, enhance_p95{0}, enhance_p99{0};
  double encode_p50{0}, encode_p95{0}, encode_p99{0};
  double invalid_rate{0};
  FpsStats fps{};
};

class MetricsRegistry {
public:
  void add_enhance(double ms) { enhance_.add(ms); }
  void add_encode(double ms) { encode_.add(ms); }

  void inc_frame() { frames_total_.fetch_add(1, std::memory_order_relaxed); }
  void inc_invalid() { invalid_total_.fetch_add(1, std::memory_order_relaxed); }
  void inc_encode_failure() { encode_failures_total_.fetch_add(1, std::memory_order_relaxed); }
  void inc_reset() { camera_resets_total_.fetch_add(1, std::memory_order_relaxed); }
  void inc_rejected() { rejected_clients_total_.fetch_add(1, std::memory_order_relaxed); }

  uint64_t frames_total() const { return frames_total_.load(std::memory_order_relaxed); }
  uint64_t invalid_total() const { return invalid_total_.load(std::memory_order_relaxed); }
  uint64_t encode_failures_total() const {
    return encode_failures_total_.load(std::memory_order_relaxed);
  }
  uint64_t camera_resets_total() const {
    return camera_resets_total_.load(std::memory_order_relaxed);
  }
  uint64_t rejected_clients_total() const {
    return rejected_clients_total_.load(std::memory_order_relaxed);
  }

  StatSnapshot snapshot(const FpsStats& fps) const;
  std::string prometheus_text(const StatSnapshot& s) const;

private:
  RollingHist enhance_, encode_;
  std::atomic<uint64_t> frames_total_{0};
  std::atomic<uint64_t> invalid_total_{0};
  std::atomic<uint64_t> encode_failures_total_{0};
  std::atomic<uint64_t> camera_resets_total_{0};
  std::atomic<uint64_t> rejected_clients_total_{0};
};
