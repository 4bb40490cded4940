#pragma once
#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>

#include <opencv2/core.hpp>

#include "metrics.hpp"
#include "types.hpp"

using JpegBytes = std::vector<uchar>;

// Single-slot, most-recent-wins holder of the last display frame.
class LatestFrameStore {
public:
  LatestFrameStore() : last_time_(Clock::now()) {}

  void publish(cv::Mat frame, TimePoint t);
  cv::Mat latest() const;  // deep copy; empty until the first publish
  bool has_frame() const;
  // Time of the newest frame, or construction time before the first one.
  TimePoint last_frame_time() const;
  uint64_t published() const { return published_.load(); }

private:
  mutable std::mutex mu_;
  cv::Mat frame_;
  TimePoint last_time_;
  std::atomic<uint64_t> published_{0};
};

struct EncodedFrame {
  std::shared_ptr<const JpegBytes> bytes;
  uint64_t seq{0};
  TimePoint t_publish{};

  bool empty() const { return !bytes || bytes->empty(); }
};

// One JPEG encode per capture cycle, shared by every client. Published buffers
// are immutable; readers hold them by shared_ptr.
class EncodeCache {
public:
  explicit EncodeCache(int jpeg_quality = 80, size_t ring = 3, MetricsRegistry* metrics = nullptr);

  bool encode_and_cache(const cv::Mat& frame);
  void publish(JpegBytes bytes);
  EncodedFrame get() const;
  uint64_t sequence() const;
  int quality() const { return quality_; }

private:
  JpegBytes take_spare_buffer();

  int quality_;
  size_t ring_size_;
  MetricsRegistry* metrics_;

  mutable std::mutex mu_;
  EncodedFrame current_;
  std::deque<std::shared_ptr<JpegBytes>> recent_;  // newest last; owns reusable storage
};
