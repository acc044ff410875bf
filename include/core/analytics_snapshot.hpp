#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "core/analysis_mode.hpp"
#include "core/crowd_density_estimator.hpp"
#include "core/zone.hpp"

namespace fta {

struct ZoneSnapshot {
  std::string id;
  std::string name;
  ZoneType type{ZoneType::Counting};
  int count{0};
  float rolling_average{0.f};
  int capacity{0};
  float occupancy_percent{0.f};
};

// What the outside world sees of the pipeline. Built once per processed frame and never modified afterwards
struct AnalyticsSnapshot {
  std::uint64_t frame_id{0};
  std::chrono::system_clock::time_point timestamp{};

  int current_count{0};
  int total_entries{0};
  int total_exits{0};
  int unique_visitors{0};
  float fps{0.f};
  int active_tracks{0};

  std::vector<ZoneSnapshot> zones;

  AnalysisMode mode{AnalysisMode::Tracking};
  bool crowd_mode{false};
  float crowd_confidence{0.f};
  DensityBand density_band{DensityBand::Empty};
};

} // namespace fta
