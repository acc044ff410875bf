#pragma once

#include <cstdint>
#include <vector>

#include <opencv2/core/types.hpp>

namespace fta {

// Axis aligned box in image pixel coordinates
struct BBox {
  float left{0.f};
  float top{0.f};
  float right{0.f};
  float bottom{0.f};

  float width() const { return right - left; }
  float height() const { return bottom - top; }
  float area() const { return width() * height(); }
  float center_x() const { return (left + right) * 0.5f; }
  float center_y() const { return (top + bottom) * 0.5f; }
  cv::Point2f center() const { return {center_x(), center_y()}; }

  static BBox FromCenter(float cx, float cy, float w, float h) {
    return BBox{cx - w * 0.5f, cy - h * 0.5f, cx + w * 0.5f, cy + h * 0.5f};
  }
};

inline constexpr std::int32_t kPersonClassId = 0;
inline constexpr int kNoTrackId = -1;

// A single detection. track_id stays kNoTrackId until the tracker annotates it
struct Detection {
  BBox bbox;
  float confidence{0.f};
  std::int32_t class_id{kPersonClassId};
  int track_id{kNoTrackId};
};

using DetectionList = std::vector<Detection>;

} // namespace fta
