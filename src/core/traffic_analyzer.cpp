#include "core/traffic_analyzer.hpp"

#include <iostream>
#include <set>

#include "core/geometry.hpp"

namespace fta {

static bool SameLine(const CountingLine& a, const CountingLine& b) {
  return a.start == b.start && a.end == b.end;
}

TrafficAnalyzer::TrafficAnalyzer(AnalyzerSettings settings)
    : settings_(std::move(settings)),
      tracker_(settings_.tracker),
      line_counter_(settings_.line),
      crowd_(settings_.crowd) {}

AnalyticsSnapshot TrafficAnalyzer::process(const Frame& frame,
                                           const DetectionList& detections,
                                           std::chrono::steady_clock::time_point started_at) {
  // Fallible work first: nothing persistent has been touched yet if any of this throws
  const DetectionList dets = SanitizeDetections(detections);
  const int raw_count = static_cast<int>(dets.size());

  const bool crowd_predicate = crowd_.should_enter_crowd_mode(frame.image, raw_count);
  const CrowdAnalysis crowd = crowd_predicate ? crowd_.estimate(frame.image, raw_count)
                                              : CrowdDensityEstimator::Passthrough(raw_count);

  // Commit
  if (mode_.update(crowd_predicate)) {
    std::cout << "[analyzer] mode -> " << ToString(mode_.mode())
              << " (detections=" << raw_count << ")" << std::endl;
  }

  last_crossings_.clear();

  const bool run_tracker = !mode_.in_crowd_mode() || raw_count < kCrowdTrackingLimit;
  if (run_tracker) {
    // Whole live set, a lost track counts at its predicted position until it is retired
    last_tracks_ = tracker_.update(dets);
    count_crossings(last_tracks_);

    if (!tracker_.removed_last_update().empty()) {
      std::set<int> alive;
      for (const auto& kv : tracker_.tracks()) alive.insert(kv.first);
      line_counter_.remove_stale_tracks(alive);
    }
  }

  if (mode_.in_crowd_mode()) {
    current_count_.store(crowd.estimated_count, std::memory_order_relaxed);
    zones_.update_from_density(settings_.zones, crowd.density_map, frame.width(), frame.height());
  } else {
    current_count_.store(static_cast<int>(last_tracks_.size()), std::memory_order_relaxed);
    zones_.update_from_tracks(settings_.zones, last_tracks_);
  }

  const auto elapsed = std::chrono::steady_clock::now() - started_at;
  const double ms = std::chrono::duration<double, std::milli>(elapsed).count();
  fps_.store(ms > 0.0 ? static_cast<float>(1000.0 / ms) : 0.f, std::memory_order_relaxed);

  return build_snapshot(frame.sequence_id, crowd);
}

void TrafficAnalyzer::count_crossings(const DetectionList& tracks) {
  for (const auto& t : tracks) {
    const CrossingDirection dir = line_counter_.check_crossing(t.track_id, t.bbox);
    if (dir == CrossingDirection::None) continue;

    if (dir == CrossingDirection::Entry) {
      total_entries_.fetch_add(1, std::memory_order_relaxed);
      unique_visitors_.fetch_add(1, std::memory_order_relaxed);
    } else {
      total_exits_.fetch_add(1, std::memory_order_relaxed);
    }
    last_crossings_.emplace_back(t.track_id, dir);

    if (settings_.log_events) {
      std::cout << "[analyzer] " << ToString(dir) << " track " << t.track_id << std::endl;
    }
  }
}

AnalyticsSnapshot TrafficAnalyzer::build_snapshot(std::uint64_t frame_id, const CrowdAnalysis& crowd) const {
  AnalyticsSnapshot s;
  s.frame_id = frame_id;
  s.timestamp = std::chrono::system_clock::now();

  const CounterValues c = counters();
  s.current_count = c.current_count;
  s.total_entries = c.total_entries;
  s.total_exits = c.total_exits;
  s.unique_visitors = c.unique_visitors;
  s.fps = c.fps;
  s.active_tracks = static_cast<int>(tracker_.size());

  s.zones.reserve(settings_.zones.size());
  for (const auto& z : settings_.zones) {
    const ZoneOccupancyView occ = zones_.occupancy(z.id);
    ZoneSnapshot zs;
    zs.id = z.id;
    zs.name = z.name;
    zs.type = z.type;
    zs.count = occ.count;
    zs.rolling_average = occ.rolling_average;
    zs.capacity = z.capacity;
    zs.occupancy_percent = OccupancyPercent(occ.count, z.capacity);
    s.zones.push_back(std::move(zs));
  }

  s.mode = mode_.mode();
  s.crowd_mode = crowd.in_crowd_mode;
  s.crowd_confidence = crowd.confidence;
  s.density_band = crowd.band;
  return s;
}

void TrafficAnalyzer::apply_settings(const AnalyzerSettings& settings) {
  const bool line_changed = !SameLine(settings.line, settings_.line);
  settings_ = settings;

  tracker_.set_params(settings_.tracker);
  crowd_.set_params(settings_.crowd);

  if (line_changed) {
    line_counter_.set_line(settings_.line);
    std::cout << "[analyzer] counting line changed, crossing history cleared" << std::endl;
  }
}

void TrafficAnalyzer::reset() {
  current_count_.store(0, std::memory_order_relaxed);
  total_entries_.store(0, std::memory_order_relaxed);
  total_exits_.store(0, std::memory_order_relaxed);
  unique_visitors_.store(0, std::memory_order_relaxed);
  fps_.store(0.f, std::memory_order_relaxed);

  tracker_.clear();
  line_counter_.reset();
  zones_.reset();
  crowd_.reset();
  mode_.reset();

  last_tracks_.clear();
  last_crossings_.clear();

  std::cout << "[analyzer] counters reset" << std::endl;
}

CounterValues TrafficAnalyzer::counters() const {
  CounterValues c;
  c.current_count = current_count_.load(std::memory_order_relaxed);
  c.total_entries = total_entries_.load(std::memory_order_relaxed);
  c.total_exits = total_exits_.load(std::memory_order_relaxed);
  c.unique_visitors = unique_visitors_.load(std::memory_order_relaxed);
  c.fps = fps_.load(std::memory_order_relaxed);
  return c;
}

} // namespace fta
