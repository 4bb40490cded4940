#include "enhancer.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <opencv2/imgproc.hpp>
#include <vector>

namespace {

uchar clamp_u8(double v) { return cv::saturate_cast<uchar>(v); }

}  // namespace

Enhancer::Enhancer(const EnhancerConfig& cfg) : cfg_(cfg) {
  lut_.create(1, 256, CV_8UC3);
  for (int i = 0; i < 256; ++i) {
    // BGR order
    lut_.at<cv::Vec3b>(0, i) = cv::Vec3b(clamp_u8(i * cfg_.blue_gain + cfg_.brightness_lift),
                                         clamp_u8(i * cfg_.green_gain + cfg_.brightness_lift),
                                         clamp_u8(i * cfg_.red_gain + cfg_.brightness_lift));
  }
  sharpen_kernel_ = (cv::Mat_<float>(3, 3) << 0, -1, 0, -1, 5, -1, 0, -1, 0);
}

std::optional<cv::Mat> Enhancer::enhance(const cv::Mat& raw, const ProcessingConfig& pc,
                                         const NightVisionState& nv, const FpsStats& fps,
                                         std::chrono::system_clock::time_point now) {
  if (!is_valid_frame(raw)) return std::nullopt;

  try {
    return render(raw, pc, nv, fps, now);
  } catch (const cv::Exception& e) {
    spdlog::warn("Enhancement failed, passing raw frame through: {}", e.what());
  } catch (const std::exception& e) {
    spdlog::warn("Enhancement failed, passing raw frame through: {}", e.what());
  }
  return raw.clone();
}

cv::Mat Enhancer::render(const cv::Mat& raw, const ProcessingConfig& pc,
                         const NightVisionState& nv, const FpsStats& fps,
                         std::chrono::system_clock::time_point now) {
  cv::Mat out = nv.active ? apply_night(raw, pc, nv) : apply_standard(raw, pc);
  draw_overlay(out, pc, nv, fps, now);
  return out;
}

bool Enhancer::is_valid_frame(const cv::Mat& raw) const {
  if (raw.empty() || raw.type() != CV_8UC3) return false;
  const int side = std::max(1, std::min(raw.rows, raw.cols) / 4);
  cv::Rect roi((raw.cols - side) / 2, (raw.rows - side) / 2, side, side);

  cv::Mat gray;
  cv::cvtColor(raw(roi), gray, cv::COLOR_BGR2GRAY);
  cv::Scalar mean, stddev;
  cv::meanStdDev(gray, mean, stddev);
  if (mean[0] < cfg_.min_valid_mean) {
    spdlog::debug("Rejecting near-black frame (mean {:.2f})", mean[0]);
    return false;
  }
  if (stddev[0] < cfg_.min_valid_stddev) {
    spdlog::debug("Rejecting near-uniform frame (stddev {:.2f})", stddev[0]);
    return false;
  }
  return true;
}

cv::Mat Enhancer::apply_standard(const cv::Mat& raw, const ProcessingConfig& pc) const {
  cv::Mat out;
  cv::LUT(raw, lut_, out);

  if (pc.reduce_processing) return out;
  if (pc.processing_level >= 2) correct_highlights(out);
  if (pc.processing_level >= 1) sharpen(out);
  return out;
}

// Cools blown-out areas: red -10, green -5, blue +15 where mean brightness > 200.
void Enhancer::correct_highlights(cv::Mat& frame) const {
  cv::Mat gray, mask;
  cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
  cv::threshold(gray, mask, 200, 255, cv::THRESH_BINARY);
  if (cv::countNonZero(mask) == 0) return;
  cv::add(frame, cv::Scalar(15, 0, 0), frame, mask);
  cv::subtract(frame, cv::Scalar(0, 5, 10), frame, mask);
}

void Enhancer::sharpen(cv::Mat& frame) const {
  cv::Mat sharp;
  cv::filter2D(frame, sharp, -1, sharpen_kernel_);
  cv::addWeighted(sharp, cfg_.sharpen_weight, frame, 1.0 - cfg_.sharpen_weight, 0, frame);
}

cv::Mat Enhancer::apply_night(const cv::Mat& raw, const ProcessingConfig& pc,
                              const NightVisionState& nv) const {
  const double strength = std::clamp(nv.strength, NightVision::kMinStrength,
                                     NightVision::kMaxStrength);
  cv::Mat out;
  raw.convertTo(out, -1, 1.5 + strength, 30.0 * strength);

  if (!pc.reduce_processing) {
    cv::GaussianBlur(out, out, cv::Size(3, 3), 0);
  }

  if (nv.green_mode) {
    cv::Mat gray;
    cv::cvtColor(out, gray, cv::COLOR_BGR2GRAY);
    cv::Mat zeros = cv::Mat::zeros(gray.size(), gray.type());
    cv::Mat green;
    cv::merge(std::vector<cv::Mat>{zeros, gray, zeros}, green);
    cv::addWeighted(out, 1.0 - strength, green, strength, 0, out);
  }
  return out;
}

void Enhancer::draw_overlay(cv::Mat& frame, const ProcessingConfig& pc, const NightVisionState& nv,
                            const FpsStats& fps, std::chrono::system_clock::time_point now) {
  // The timestamp text changes once a second; it is redrawn every frame.
  const std::time_t secs = std::chrono::system_clock::to_time_t(now);
  if (secs != stamp_second_) {
    std::tm tm{};
    localtime_r(&secs, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    stamp_text_ = buf;
    stamp_second_ = secs;
  }

  std::string telemetry = fmt::format("FPS: {:.1f}", fps.current);
  if (nv.active) telemetry += " NIGHT";
  if (pc.reduce_processing) telemetry += " LOW";

  draw_label(frame, stamp_text_, cv::Point(10, 25));
  draw_label(frame, telemetry, cv::Point(10, 50));
}

void Enhancer::draw_label(cv::Mat& frame, const std::string& text, cv::Point origin) const {
  const int font = cv::FONT_HERSHEY_SIMPLEX;
  const double scale = 0.6;
  const int thickness = 1;
  int baseline = 0;
  cv::Size sz = cv::getTextSize(text, font, scale, thickness, &baseline);

  cv::Rect bg(origin.x - 4, origin.y - sz.height - 4, sz.width + 8, sz.height + baseline + 8);
  bg &= cv::Rect(0, 0, frame.cols, frame.rows);
  if (bg.area() > 0) {
    cv::Mat roi = frame(bg);
    cv::Mat black(roi.size(), roi.type(), cv::Scalar::all(0));
    cv::addWeighted(black, cfg_.overlay_alpha, roi, 1.0 - cfg_.overlay_alpha, 0, roi);
  }
  cv::putText(frame, text, origin, font, scale, cv::Scalar(255, 255, 255), thickness, cv::LINE_AA);
}
