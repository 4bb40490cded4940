#include "metrics.hpp"

#include <sstream>

void FpsTracker::tick(TimePoint t) {
  std::lock_guard<std::mutex> g(mu_);
  if (stamps_.size() == window_) stamps_.pop_front();
  stamps_.push_back(t);
  recompute();
}

FpsStats FpsTracker::stats() const {
  std::lock_guard<std::mutex> g(mu_);
  return stats_;
}

size_t FpsTracker::samples() const {
  std::lock_guard<std::mutex> g(mu_);
  return stamps_.size();
}

void FpsTracker::reset() {
  std::lock_guard<std::mutex> g(mu_);
  stamps_.clear();
  stats_ = FpsStats{};
}

// Caller holds mu_.
void FpsTracker::recompute() {
  stats_ = FpsStats{};
  if (stamps_.size() < 2) return;

  bool first = true;
  double rate_sum = 0.0;
  size_t intervals = 0;
  for (size_t i = 1; i < stamps_.size(); ++i) {
    double dt = std::chrono::duration<double>(stamps_[i] - stamps_[i - 1]).count();
    if (dt <= 0.0) continue;
    double rate = 1.0 / dt;
    if (first) {
      stats_.min = stats_.max = rate;
      first = false;
    } else {
      stats_.min = std::min(stats_.min, rate);
      stats_.max = std::max(stats_.max, rate);
    }
    rate_sum += rate;
    ++intervals;
  }
  if (intervals > 0) stats_.avg = rate_sum / static_cast<double>(intervals);

  // Whole-window rate; a single late frame only moves it by one interval's share.
  double span = std::chrono::duration<double>(stamps_.back() - stamps_.front()).count();
  if (span > 0.0) stats_.current = static_cast<double>(stamps_.size() - 1) / span;
}

StatSnapshot MetricsRegistry::snapshot(const FpsStats& fps) const {
  StatSnapshot s{};
  s.enhance_p50 = enhance_.perc(50); s.enhance_p95 = enhance_.perc(95); s.enhance_p99 = enhance_.perc(99);
  s.encode_p50 = encode_.perc(50);   s.encode_p95 = encode_.perc(95);   s.encode_p99 = encode_.perc(99);
  const auto frames = frames_total_.load();
  const auto invalid = invalid_total_.load();
  const auto seen = frames + invalid;
  s.invalid_rate = seen ? (static_cast<double>(invalid) / static_cast<double>(seen)) : 0.0;
  s.fps = fps;
  return s;
}

std::string MetricsRegistry::prometheus_text(const StatSnapshot& s) const {
  std::ostringstream os;
  os << "nightstream_frames_captured_total " << frames_total_.load() << "\n";
  os << "nightstream_frames_invalid_total " << invalid_total_.load() << "\n";
  os << "nightstream_encode_failures_total " << encode_failures_total_.load() << "\n";
  os << "nightstream_camera_resets_total " << camera_resets_total_.load() << "\n";
  os << "nightstream_clients_rejected_total " << rejected_clients_total_.load() << "\n";

  os << "nightstream_enhance_ms{quantile=\"0.5\"} "  << s.enhance_p50 << "\n";
  os << "nightstream_enhance_ms{quantile=\"0.95\"} " << s.enhance_p95 << "\n";
  os << "nightstream_enhance_ms{quantile=\"0.99\"} " << s.enhance_p99 << "\n";
  os << "nightstream_encode_ms{quantile=\"0.5\"} "   << s.encode_p50 << "\n";
  os << "nightstream_encode_ms{quantile=\"0.95\"} "  << s.encode_p95 << "\n";
  os << "nightstream_encode_ms{quantile=\"0.99\"} "  << s.encode_p99 << "\n";

  os << "nightstream_fps_current " << s.fps.current << "\n";
  os << "nightstream_fps_avg " << s.fps.avg << "\n";
  os << "nightstream_invalid_frame_rate " << s.invalid_rate << "\n";
  return os.str();
}
