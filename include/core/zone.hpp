#pragma once

#include <string>
#include <vector>

#include <opencv2/core/types.hpp>

namespace fta {

enum class ZoneType {
  Counting,
  Entry,
  Exit,
  Exclusion
};

const char* ToString(ZoneType t);

// Throws std::invalid_argument on an unknown name. Accepts: counting | entry | exit | exclusion
ZoneType ParseZoneType(const std::string& s);

// A configured polygon region. Vertices are expected to form a simple (non self-intersecting) polygon
struct Zone {
  std::string id;
  std::string name;
  std::vector<cv::Point2f> points;
  int capacity{50};
  ZoneType type{ZoneType::Counting};

  bool contains(float x, float y) const;
  bool contains(const cv::Point2f& p) const { return contains(p.x, p.y); }
};

// count / capacity * 100, 0 when capacity is not positive
float OccupancyPercent(int count, int capacity);

// The zone used when none are configured, roughly the full 1080p frame with a 100px margin
Zone DefaultZone();

} // namespace fta
