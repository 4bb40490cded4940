#include "frame_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <opencv2/imgcodecs.hpp>

void LatestFrameStore::publish(cv::Mat frame, TimePoint t) {
  std::lock_guard<std::mutex> g(mu_);
  frame_ = std::move(frame);
  last_time_ = t;
  published_.fetch_add(1);
}

cv::Mat LatestFrameStore::latest() const {
  std::lock_guard<std::mutex> g(mu_);
  return frame_.clone();
}

bool LatestFrameStore::has_frame() const {
  std::lock_guard<std::mutex> g(mu_);
  return !frame_.empty();
}

TimePoint LatestFrameStore::last_frame_time() const {
  std::lock_guard<std::mutex> g(mu_);
  return last_time_;
}

EncodeCache::EncodeCache(int jpeg_quality, size_t ring, MetricsRegistry* metrics)
    : quality_(std::clamp(jpeg_quality, 75, 85)),
      ring_size_(std::max<size_t>(1, ring)),
      metrics_(metrics) {}

bool EncodeCache::encode_and_cache(const cv::Mat& frame) {
  if (frame.empty()) return false;

  auto t0 = Clock::now();
  JpegBytes buf = take_spare_buffer();
  bool ok = false;
  try {
    ok = cv::imencode(".jpg", frame, buf, {cv::IMWRITE_JPEG_QUALITY, quality_});
  } catch (const cv::Exception& e) {
    spdlog::warn("JPEG encode threw: {}", e.what());
  }
  if (!ok || buf.empty()) {
    spdlog::warn("JPEG encode failed, keeping previous frame");
    if (metrics_) metrics_->inc_encode_failure();
    return false;
  }
  if (metrics_) metrics_->add_encode(ms_between(t0, Clock::now()));

  publish(std::move(buf));
  return true;
}

void EncodeCache::publish(JpegBytes bytes) {
  auto shared = std::make_shared<JpegBytes>(std::move(bytes));
  std::lock_guard<std::mutex> g(mu_);
  current_.bytes = shared;
  current_.seq++;
  current_.t_publish = Clock::now();
  recent_.push_back(std::move(shared));
  while (recent_.size() > ring_size_) recent_.pop_front();
}

EncodedFrame EncodeCache::get() const {
  std::lock_guard<std::mutex> g(mu_);
  return current_;
}

uint64_t EncodeCache::sequence() const {
  std::lock_guard<std::mutex> g(mu_);
  return current_.seq;
}

// Reuses the storage of the oldest ring entry once no client still holds it.
JpegBytes EncodeCache::take_spare_buffer() {
  std::shared_ptr<JpegBytes> oldest;
  {
    std::lock_guard<std::mutex> g(mu_);
    if (recent_.size() < ring_size_ || recent_.front() == current_.bytes) return JpegBytes{};
    oldest = std::move(recent_.front());
    recent_.pop_front();
  }
  if (oldest.use_count() != 1) return JpegBytes{};
  // Pairs with the release in the last reader's shared_ptr decrement.
  std::atomic_thread_fence(std::memory_order_acquire);
  JpegBytes spare = std::move(*oldest);
  spare.clear();
  return spare;
}
