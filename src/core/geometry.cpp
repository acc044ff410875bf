#include "core/geometry.hpp"

#include <algorithm>
#include <cmath>

namespace fta {

float IoU(const BBox& a, const BBox& b) {
  const float ix1 = std::max(a.left, b.left);
  const float iy1 = std::max(a.top, b.top);
  const float ix2 = std::min(a.right, b.right);
  const float iy2 = std::min(a.bottom, b.bottom);

  const float inter = std::max(0.f, ix2 - ix1) * std::max(0.f, iy2 - iy1);
  const float uni = a.area() + b.area() - inter;
  return (uni > 0.f) ? (inter / uni) : 0.f;
}

bool PointInPolygon(const std::vector<cv::Point2f>& polygon, const cv::Point2f& p) {
  const std::size_t n = polygon.size();
  if (n < 3) return false;

  bool inside = false;
  for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
    const cv::Point2f& a = polygon[i];
    const cv::Point2f& b = polygon[j];

    // Edge straddles the ray's y (half-open, so shared vertices count once)
    if ((a.y > p.y) != (b.y > p.y)) {
      const float x_cross = (b.x - a.x) * (p.y - a.y) / (b.y - a.y) + a.x;
      if (p.x < x_cross) inside = !inside;
    }
  }
  return inside;
}

float LineSide(const cv::Point2f& a, const cv::Point2f& b, const cv::Point2f& p) {
  return (p.x - a.x) * (b.y - a.y) - (p.y - a.y) * (b.x - a.x);
}

static bool IsFinite(const BBox& b) {
  return std::isfinite(b.left) && std::isfinite(b.top) && std::isfinite(b.right) && std::isfinite(b.bottom);
}

DetectionList SanitizeDetections(const DetectionList& in) {
  DetectionList out;
  out.reserve(in.size());
  for (const auto& d : in) {
    if (!IsFinite(d.bbox) || !std::isfinite(d.confidence)) continue;
    if (d.bbox.width() <= 0.f || d.bbox.height() <= 0.f) continue;

    Detection clean = d;
    clean.confidence = std::max(0.f, std::min(1.f, d.confidence));
    clean.track_id = kNoTrackId;
    out.push_back(clean);
  }
  return out;
}

} // namespace fta
