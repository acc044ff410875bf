#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include <opencv2/core/mat.hpp>

#include "core/detections.hpp"
#include "core/zone.hpp"
#include "infra/concurrent_map.hpp"
#include "infra/ring_buffer.hpp"

namespace fta {

inline constexpr std::size_t kZoneHistoryCapacity = 30;

// Weight applied to a zone's mean grid density before scaling by capacity, crowd mode only
inline constexpr float kCrowdZoneScale = 0.8f;

struct ZoneOccupancy {
  int count{0};
  RingBuffer<int, kZoneHistoryCapacity> history;

  float rolling_average() const;
};

struct ZoneOccupancyView {
  int count{0};
  float rolling_average{0.f};
};

/*
    ZoneAggregator keeps the instantaneous count and a 30 sample rolling window per zone id.

    Zones come from configuration and can change between frames. An id that disappears from the configuration simply
    stops receiving updates, its last values stay readable until reset().

    Writes come from the analytics worker only, reads may come from any thread.
*/
class ZoneAggregator {
public:
  ZoneAggregator() = default;

  void update(const std::string& zone_id, int count);

  // Unknown ids read as zero
  ZoneOccupancyView occupancy(const std::string& zone_id) const;

  // Per track membership: count of track centers inside each zone polygon
  void update_from_tracks(const std::vector<Zone>& zones, const DetectionList& tracks);

  // Crowd mode approximation from the density grid, see EstimateFromDensity
  void update_from_density(const std::vector<Zone>& zones, const cv::Mat1f& grid, int frame_width, int frame_height);

  std::map<std::string, ZoneOccupancyView> all() const;
  bool knows(const std::string& zone_id) const { return zones_.contains(zone_id); }

  void reset();

  static int CountMembers(const Zone& zone, const DetectionList& tracks);

  // Sum of the densities of the grid cells whose image-space center is inside the zone, normalised by the number of
  // those cells, times capacity and kCrowdZoneScale.
  // 0 when no cell center falls inside the polygon
  static int EstimateFromDensity(const Zone& zone, const cv::Mat1f& grid, int frame_width, int frame_height);

private:
  ConcurrentMap<std::string, ZoneOccupancy> zones_;
};

} // namespace fta
