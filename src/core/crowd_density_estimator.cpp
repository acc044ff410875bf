#include "core/crowd_density_estimator.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace fta {

static constexpr int kQuickSampleStride = 10;
static constexpr int kSignalSampleStride = 5;
static constexpr int kMinEdgeThreshold = 50;
static constexpr int kTextureWindow = 16;
static constexpr int kMotionThreshold = 30;
static constexpr int kForegroundThreshold = 30;
static constexpr int kDarkPixelGray = 100;

static constexpr float kPixelsPerPersonSparse = 5000.f;
static constexpr float kPixelsPerPersonDense = 2500.f;
static constexpr float kPixelsPerPersonPacked = 1500.f;

static constexpr float kPassthroughConfidence = 0.9f;

const char* ToString(DensityBand b) {
  switch (b) {
    case DensityBand::Empty: return "empty";
    case DensityBand::Sparse: return "sparse";
    case DensityBand::Moderate: return "moderate";
    case DensityBand::Dense: return "dense";
    case DensityBand::Packed: return "packed";
  }
  return "unknown";
}

// Any 8-bit input to 3 channel BGR, so pixel access below can assume cv::Vec3b
static cv::Mat ToBgr(const cv::Mat& frame) {
  if (frame.empty()) return frame;
  if (frame.depth() != CV_8U) {
    throw std::invalid_argument("CrowdDensityEstimator expects 8-bit images");
  }
  if (frame.channels() == 3) return frame;

  cv::Mat bgr;
  if (frame.channels() == 1) {
    cv::cvtColor(frame, bgr, cv::COLOR_GRAY2BGR);
  } else if (frame.channels() == 4) {
    cv::cvtColor(frame, bgr, cv::COLOR_BGRA2BGR);
  } else {
    throw std::invalid_argument("CrowdDensityEstimator expects 1, 3 or 4 channel images");
  }
  return bgr;
}

static int ColorDifference(const cv::Vec3b& a, const cv::Vec3b& b) {
  return std::abs(a[0] - b[0]) + std::abs(a[1] - b[1]) + std::abs(a[2] - b[2]);
}

CrowdDensityEstimator::CrowdDensityEstimator(CrowdParams params) : params_(params) {}

DensityBand CrowdDensityEstimator::BandForCount(int count) {
  if (count <= 0) return DensityBand::Empty;
  if (count <= 10) return DensityBand::Sparse;
  if (count <= 30) return DensityBand::Moderate;
  if (count <= 50) return DensityBand::Dense;
  return DensityBand::Packed;
}

CrowdAnalysis CrowdDensityEstimator::Passthrough(int detector_count) {
  CrowdAnalysis a;
  a.estimated_count = std::max(0, detector_count);
  a.band = BandForCount(a.estimated_count);
  a.density_map = cv::Mat1f::zeros(kDensityGridSize, kDensityGridSize);
  a.confidence = kPassthroughConfidence;
  a.in_crowd_mode = false;
  return a;
}

float CrowdDensityEstimator::QuickDensity(const cv::Mat& frame) {
  if (frame.empty()) return 0.f;
  const cv::Mat bgr = ToBgr(frame);

  int edge_pixels = 0;
  int total = 0;
  for (int y = 0; y < bgr.rows; y += kQuickSampleStride) {
    for (int x = 0; x < bgr.cols; x += kQuickSampleStride) {
      if (x > 0 && y > 0) {
        const cv::Vec3b& p = bgr.at<cv::Vec3b>(y, x);
        const int diff = ColorDifference(p, bgr.at<cv::Vec3b>(y, x - kQuickSampleStride)) +
                         ColorDifference(p, bgr.at<cv::Vec3b>(y - kQuickSampleStride, x));
        if (diff > kMinEdgeThreshold * 2) ++edge_pixels;
      }
      ++total;
    }
  }
  return (total > 0) ? static_cast<float>(edge_pixels) / static_cast<float>(total) : 0.f;
}

float CrowdDensityEstimator::EdgeDensity(const cv::Mat& gray) {
  if (gray.rows < 3 || gray.cols < 3) return 0.f;

  cv::Mat gx, gy, mag;
  cv::Sobel(gray, gx, CV_32F, 1, 0, 3);
  cv::Sobel(gray, gy, CV_32F, 0, 1, 3);
  cv::magnitude(gx, gy, mag);

  // Border pixels have no full 3x3 neighborhood and are not considered
  const cv::Mat inner = mag(cv::Rect(1, 1, gray.cols - 2, gray.rows - 2));
  const int edges = cv::countNonZero(inner > static_cast<float>(kMinEdgeThreshold));

  const double total = static_cast<double>(gray.cols) * gray.rows;
  return static_cast<float>(edges / total * 10.0);
}

float CrowdDensityEstimator::TextureDensity(const cv::Mat& gray) {
  double total = 0.0;
  int windows = 0;

  for (int y = 0; y < gray.rows - kTextureWindow; y += kTextureWindow) {
    for (int x = 0; x < gray.cols - kTextureWindow; x += kTextureWindow) {
      cv::Scalar mean, stddev;
      cv::meanStdDev(gray(cv::Rect(x, y, kTextureWindow, kTextureWindow)), mean, stddev);
      total += stddev[0] / 128.0;
      ++windows;
    }
  }
  return (windows > 0) ? static_cast<float>(total / windows * 2.0) : 0.f;
}

float CrowdDensityEstimator::ForegroundRatio(const cv::Mat& gray) {
  std::array<int, 256> histogram{};
  for (int y = 0; y < gray.rows; y += kSignalSampleStride) {
    for (int x = 0; x < gray.cols; x += kSignalSampleStride) {
      ++histogram[gray.at<uchar>(y, x)];
    }
  }

  // First most frequent gray level is taken as the background
  const int background = static_cast<int>(std::max_element(histogram.begin(), histogram.end()) - histogram.begin());

  int foreground = 0;
  int total = 0;
  for (int y = 0; y < gray.rows; y += kSignalSampleStride) {
    for (int x = 0; x < gray.cols; x += kSignalSampleStride) {
      if (std::abs(gray.at<uchar>(y, x) - background) > kForegroundThreshold) ++foreground;
      ++total;
    }
  }
  return (total > 0) ? static_cast<float>(foreground) / static_cast<float>(total) * 3.f : 0.f;
}

cv::Mat1f CrowdDensityEstimator::DensityMap(const cv::Mat& gray) {
  cv::Mat1f grid = cv::Mat1f::zeros(kDensityGridSize, kDensityGridSize);

  const int cell_w = gray.cols / kDensityGridSize;
  const int cell_h = gray.rows / kDensityGridSize;
  if (cell_w == 0 || cell_h == 0) return grid;

  const float cell_area = static_cast<float>(cell_w * cell_h);
  for (int gy = 0; gy < kDensityGridSize; ++gy) {
    for (int gx = 0; gx < kDensityGridSize; ++gx) {
      const cv::Mat cell = gray(cv::Rect(gx * cell_w, gy * cell_h, cell_w, cell_h));
      // Darker pixels are taken to be people
      grid(gy, gx) = static_cast<float>(cv::countNonZero(cell < kDarkPixelGray)) / cell_area;
    }
  }
  return grid;
}

float CrowdDensityEstimator::PixelsPerPerson(float density) {
  if (density < 0.3f) return kPixelsPerPersonSparse;
  if (density < 0.6f) return kPixelsPerPersonDense;
  return kPixelsPerPersonPacked;
}

float CrowdDensityEstimator::CorrectionFactor(float density) {
  if (density < 0.2f) return 1.2f;
  if (density < 0.5f) return 1.0f;
  if (density < 0.7f) return 0.9f;
  return 0.85f;
}

int CrowdDensityEstimator::EstimateCountFromDensity(float density, int image_area) {
  const int base = static_cast<int>(static_cast<float>(image_area) * density / PixelsPerPerson(density));
  const int corrected = static_cast<int>(static_cast<float>(base) * CorrectionFactor(density));
  return std::max(1, corrected);
}

float CrowdDensityEstimator::Confidence(const CrowdSignals& s) {
  const std::array<double, 4> v{s.edge, s.texture, s.motion, s.foreground};

  double mean = 0.0;
  for (const double x : v) mean += x;
  mean /= v.size();
  if (mean <= 0.0) return 0.3f;

  double var = 0.0;
  for (const double x : v) var += (x - mean) * (x - mean);
  var /= v.size();

  const double spread = std::min(std::sqrt(var) / mean, 1.0);
  return static_cast<float>(std::max(0.3, std::min(0.9, 1.0 - spread)));
}

float CrowdDensityEstimator::motion_density(const cv::Mat& bgr) {
  if (previous_frame_.empty() || previous_frame_.size() != bgr.size()) {
    previous_frame_ = bgr.clone();
    return 0.5f;
  }

  int moving = 0;
  int total = 0;
  for (int y = 0; y < bgr.rows; y += kSignalSampleStride) {
    for (int x = 0; x < bgr.cols; x += kSignalSampleStride) {
      if (ColorDifference(bgr.at<cv::Vec3b>(y, x), previous_frame_.at<cv::Vec3b>(y, x)) > kMotionThreshold) ++moving;
      ++total;
    }
  }
  previous_frame_ = bgr.clone();

  motion_history_.push((total > 0) ? static_cast<float>(moving) / static_cast<float>(total) : 0.f);

  float sum = 0.f;
  motion_history_.for_each([&](float r) { sum += r; });
  return sum / static_cast<float>(motion_history_.size()) * 5.f;
}

bool CrowdDensityEstimator::should_enter_crowd_mode(const cv::Mat& frame, int detector_count) const {
  if (detector_count > params_.crowd_mode_threshold) return true;
  return QuickDensity(frame) > params_.high_density_threshold;
}

CrowdAnalysis CrowdDensityEstimator::estimate(const cv::Mat& frame, int detector_count) {
  CrowdAnalysis a;
  a.in_crowd_mode = true;

  if (frame.empty()) {
    a.estimated_count = std::max(0, detector_count);
    a.band = BandForCount(a.estimated_count);
    a.density_map = cv::Mat1f::zeros(kDensityGridSize, kDensityGridSize);
    a.confidence = 0.3f;
    return a;
  }

  const cv::Mat bgr = ToBgr(frame);
  cv::Mat gray;
  cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);

  CrowdSignals& s = a.signals;
  s.edge = EdgeDensity(gray);
  s.texture = TextureDensity(gray);
  s.motion = motion_density(bgr);
  s.foreground = ForegroundRatio(gray);
  s.combined = s.edge * 0.30f + s.texture * 0.25f + s.motion * 0.20f + s.foreground * 0.25f;

  a.density_map = DensityMap(gray);

  const int estimated = EstimateCountFromDensity(s.combined, bgr.cols * bgr.rows);
  a.estimated_count = std::max(estimated, detector_count);
  a.band = BandForCount(a.estimated_count);
  a.confidence = Confidence(s);
  return a;
}

CrowdAnalysis CrowdDensityEstimator::analyze(const cv::Mat& frame, int detector_count) {
  if (!should_enter_crowd_mode(frame, detector_count)) return Passthrough(detector_count);
  return estimate(frame, detector_count);
}

void CrowdDensityEstimator::reset() {
  previous_frame_.release();
  motion_history_.clear();
}

} // namespace fta
