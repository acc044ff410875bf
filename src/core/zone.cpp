#include "core/zone.hpp"

#include <stdexcept>

#include "core/geometry.hpp"

namespace fta {

const char* ToString(ZoneType t) {
  switch (t) {
    case ZoneType::Counting: return "counting";
    case ZoneType::Entry: return "entry";
    case ZoneType::Exit: return "exit";
    case ZoneType::Exclusion: return "exclusion";
  }
  return "unknown";
}

ZoneType ParseZoneType(const std::string& s) {
  if (s == "counting") return ZoneType::Counting;
  if (s == "entry") return ZoneType::Entry;
  if (s == "exit") return ZoneType::Exit;
  if (s == "exclusion") return ZoneType::Exclusion;
  throw std::invalid_argument("unknown zone type '" + s + "'. Use: counting | entry | exit | exclusion");
}

bool Zone::contains(float x, float y) const {
  return PointInPolygon(points, cv::Point2f(x, y));
}

float OccupancyPercent(int count, int capacity) {
  if (capacity <= 0) return 0.f;
  return static_cast<float>(count) / static_cast<float>(capacity) * 100.f;
}

Zone DefaultZone() {
  Zone z;
  z.id = "default";
  z.name = "Main Area";
  z.points = {{100.f, 100.f}, {1820.f, 100.f}, {1820.f, 980.f}, {100.f, 980.f}};
  z.capacity = 100;
  z.type = ZoneType::Counting;
  return z;
}

} // namespace fta
