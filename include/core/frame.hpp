#pragma once

#include <chrono>
#include <cstdint>

#include <opencv2/core.hpp>

namespace fta {

using TimePoint = std::chrono::steady_clock::time_point;

// One captured image. Only the detector and the crowd density estimator look at the pixels, the rest of the
// analytics needs the size alone. Copies share the pixel buffer (cv::Mat is ref-counted)
struct Frame {
  TimePoint capture_time{};     // steady clock, set by the camera stage
  std::uint64_t sequence_id{0}; // increasing per source, reported as the snapshot's frame id
  cv::Mat image;                // 8-bit BGR

  bool empty() const { return image.empty(); }
  int width() const { return image.cols; }
  int height() const { return image.rows; }
};

} // namespace fta
