#include "core/zone_aggregator.hpp"

#include <cmath>

namespace fta {

float ZoneOccupancy::rolling_average() const {
  if (history.empty()) return 0.f;
  double sum = 0.0;
  history.for_each([&](int v) { sum += v; });
  return static_cast<float>(sum / static_cast<double>(history.size()));
}

void ZoneAggregator::update(const std::string& zone_id, int count) {
  zones_.update(zone_id, [count](ZoneOccupancy& z) {
    z.count = count;
    z.history.push(count);
  });
}

ZoneOccupancyView ZoneAggregator::occupancy(const std::string& zone_id) const {
  const auto z = zones_.get(zone_id);
  if (!z) return {};
  return {z->count, z->rolling_average()};
}

int ZoneAggregator::CountMembers(const Zone& zone, const DetectionList& tracks) {
  int n = 0;
  for (const auto& t : tracks) {
    if (zone.contains(t.bbox.center())) ++n;
  }
  return n;
}

void ZoneAggregator::update_from_tracks(const std::vector<Zone>& zones, const DetectionList& tracks) {
  for (const auto& zone : zones) update(zone.id, CountMembers(zone, tracks));
}

int ZoneAggregator::EstimateFromDensity(const Zone& zone, const cv::Mat1f& grid, int frame_width, int frame_height) {
  if (grid.empty() || frame_width <= 0 || frame_height <= 0) return 0;

  const float cell_w = static_cast<float>(frame_width) / static_cast<float>(grid.cols);
  const float cell_h = static_cast<float>(frame_height) / static_cast<float>(grid.rows);

  double sum = 0.0;
  int cells = 0;
  for (int gy = 0; gy < grid.rows; ++gy) {
    for (int gx = 0; gx < grid.cols; ++gx) {
      const cv::Point2f c((gx + 0.5f) * cell_w, (gy + 0.5f) * cell_h);
      if (!zone.contains(c)) continue;
      sum += grid(gy, gx);
      ++cells;
    }
  }
  if (cells == 0) return 0;

  // Sum of the covered cells normalised by their count, so the estimate does not scale with zone area
  const double mean = sum / cells;
  return static_cast<int>(std::lround(mean * zone.capacity * kCrowdZoneScale));
}

void ZoneAggregator::update_from_density(const std::vector<Zone>& zones, const cv::Mat1f& grid, int frame_width, int frame_height) {
  for (const auto& zone : zones) update(zone.id, EstimateFromDensity(zone, grid, frame_width, frame_height));
}

std::map<std::string, ZoneOccupancyView> ZoneAggregator::all() const {
  std::map<std::string, ZoneOccupancyView> out;
  for (const auto& kv : zones_.snapshot()) {
    out[kv.first] = {kv.second.count, kv.second.rolling_average()};
  }
  return out;
}

void ZoneAggregator::reset() {
  zones_.clear();
}

} // namespace fta
