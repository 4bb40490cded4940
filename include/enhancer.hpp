#pragma once
#include <chrono>
#include <ctime>
#include <optional>
#include <string>

#include <opencv2/core.hpp>

#include "metrics.hpp"
#include "night_vision.hpp"
#include "types.hpp"

struct EnhancerConfig {
  // Per-channel gains and lift, applied through lookup tables.
  double red_gain{1.15};
  double green_gain{1.0};
  double blue_gain{0.75};
  double brightness_lift{15.0};

  double sharpen_weight{0.7};  // sharpened share of the 70/30 blend
  double overlay_alpha{0.6};

  double min_valid_mean{5.0};
  double min_valid_stddev{3.0};
};

// Raw camera frame -> display frame. Not thread-safe; owned by the capture loop.
class Enhancer {
public:
  explicit Enhancer(const EnhancerConfig& cfg = EnhancerConfig{});
  virtual ~Enhancer() = default;

  // nullopt means "skip this cycle" (camera glitch). Internal errors fall back to the raw frame.
  std::optional<cv::Mat> enhance(const cv::Mat& raw, const ProcessingConfig& pc,
                                 const NightVisionState& nv, const FpsStats& fps,
                                 std::chrono::system_clock::time_point now =
                                     std::chrono::system_clock::now());

  bool is_valid_frame(const cv::Mat& raw) const;

  cv::Mat apply_standard(const cv::Mat& raw, const ProcessingConfig& pc) const;
  cv::Mat apply_night(const cv::Mat& raw, const ProcessingConfig& pc,
                      const NightVisionState& nv) const;
  void draw_overlay(cv::Mat& frame, const ProcessingConfig& pc, const NightVisionState& nv,
                    const FpsStats& fps, std::chrono::system_clock::time_point now);

  const cv::Mat& color_lut() const { return lut_; }

protected:
  // Night or standard path plus overlay. May throw; enhance() catches.
  virtual cv::Mat render(const cv::Mat& raw, const ProcessingConfig& pc,
                         const NightVisionState& nv, const FpsStats& fps,
                         std::chrono::system_clock::time_point now);

private:
  void correct_highlights(cv::Mat& frame) const;
  void sharpen(cv::Mat& frame) const;
  void draw_label(cv::Mat& frame, const std::string& text, cv::Point origin) const;

  EnhancerConfig cfg_;
  cv::Mat lut_;          // 1x256 CV_8UC3, built once
  cv::Mat sharpen_kernel_;

  std::time_t stamp_second_{-1};
  std::string stamp_text_;
};
