#pragma once

#include <opencv2/core/mat.hpp>

#include "infra/ring_buffer.hpp"

/*
    CrowdDensityEstimator is the fallback when there are too many people to track one by one.

    Crowd mode is entered when the detector reports more than crowd_mode_threshold people, or when a cheap sampled
    edge metric of the frame exceeds high_density_threshold. In crowd mode four image signals are fused:

        edge density        Sobel magnitude > 50, fraction of pixels, x10
        texture density     stddev of 16x16 grayscale windows / 128, mean over windows, x2
        motion density      stride-5 frame difference ratio, mean of the last 10 frames, x5
        foreground ratio    stride-5 samples more than 30 gray levels from the modal gray, x3

    combined = 0.30 * edge + 0.25 * texture + 0.20 * motion + 0.25 * foreground

    The combined value picks a pixels-per-person divisor and an occlusion correction factor. All of these constants
    are empirical camera calibration values and are kept exactly as tuned.

    The estimate never goes below the detector count.
*/

namespace fta {

inline constexpr int kDensityGridSize = 32;

enum class DensityBand {
  Empty,     // 0
  Sparse,    // 1-10
  Moderate,  // 11-30
  Dense,     // 31-50
  Packed     // 51+
};

const char* ToString(DensityBand b);

struct CrowdParams {
  int crowd_mode_threshold{20};
  float high_density_threshold{0.7f};
};

struct CrowdSignals {
  float edge{0.f};
  float texture{0.f};
  float motion{0.f};
  float foreground{0.f};
  float combined{0.f};
};

struct CrowdAnalysis {
  int estimated_count{0};
  DensityBand band{DensityBand::Empty};
  cv::Mat1f density_map;  // kDensityGridSize x kDensityGridSize, dark pixel fraction per cell
  float confidence{0.f};
  bool in_crowd_mode{false};
  CrowdSignals signals{};
};

class CrowdDensityEstimator {
public:
  explicit CrowdDensityEstimator(CrowdParams params = {});

  // Mode switch followed by the full estimate when crowd mode is active, passthrough otherwise
  CrowdAnalysis analyze(const cv::Mat& frame, int detector_count);

  // detector_count > crowd_mode_threshold || QuickDensity(frame) > high_density_threshold
  bool should_enter_crowd_mode(const cv::Mat& frame, int detector_count) const;

  // Full signal fusion regardless of the mode switch. Updates the motion history
  CrowdAnalysis estimate(const cv::Mat& frame, int detector_count);

  // Forget the previous frame and motion history
  void reset();

  void set_params(const CrowdParams& params) { params_ = params; }
  const CrowdParams& params() const { return params_; }

  // Normal mode result: detector count, confidence 0.9, empty grid
  static CrowdAnalysis Passthrough(int detector_count);

  static DensityBand BandForCount(int count);

  // Individual signals, exposed for testing. Inputs are 8-bit BGR (frame) or 8-bit single channel (gray)
  static float QuickDensity(const cv::Mat& bgr);
  static float EdgeDensity(const cv::Mat& gray);
  static float TextureDensity(const cv::Mat& gray);
  static float ForegroundRatio(const cv::Mat& gray);
  static cv::Mat1f DensityMap(const cv::Mat& gray);

  static float PixelsPerPerson(float density);
  static float CorrectionFactor(float density);
  static int EstimateCountFromDensity(float density, int image_area);

  // 1 - min(stddev / mean, 1) over the four raw signals, clamped to [0.3, 0.9]
  static float Confidence(const CrowdSignals& s);

private:
  float motion_density(const cv::Mat& bgr);

  CrowdParams params_;
  cv::Mat previous_frame_;
  RingBuffer<float, 10> motion_history_;
};

} // namespace fta
