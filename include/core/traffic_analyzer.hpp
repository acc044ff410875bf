#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <utility>
#include <vector>

#include "core/analysis_mode.hpp"
#include "core/analytics_snapshot.hpp"
#include "core/crowd_density_estimator.hpp"
#include "core/detections.hpp"
#include "core/frame.hpp"
#include "core/line_counter.hpp"
#include "core/tracker.hpp"
#include "core/zone.hpp"
#include "core/zone_aggregator.hpp"

namespace fta {

// Above this many raw detections the tracker is skipped entirely while in crowd mode
inline constexpr int kCrowdTrackingLimit = 50;

struct AnalyzerSettings {
  TrackerParams tracker{};
  CrowdParams crowd{};
  CountingLine line{};
  std::vector<Zone> zones{DefaultZone()};
  bool log_events{false};
};

struct CounterValues {
  int current_count{0};
  int total_entries{0};
  int total_exits{0};
  int unique_visitors{0};
  float fps{0.f};
};

/*
    TrafficAnalyzer runs the per-frame analytics on an already detected frame:

        mode switch -> tracking path (tracker, line counter, zones from track centers)
                    or crowd path   (density estimate, zones from the density grid, plus tracker and line counter
                                     while the raw count stays below kCrowdTrackingLimit)
                    -> counters -> snapshot

    process() does every step that can throw (image analysis) before it touches tracker, line, zone or counter
    state, so a frame that fails leaves the persistent state as it was. The crowd estimator's motion history is the
    one exception, it has already seen the frame.

    Threading: process(), apply_settings() and reset() must be called from a single thread (the analytics worker),
    and never concurrently with each other. counters(), zones() and line_counter() reads are safe from any thread.
*/
class TrafficAnalyzer {
public:
  explicit TrafficAnalyzer(AnalyzerSettings settings = {});

  TrafficAnalyzer(const TrafficAnalyzer&) = delete;
  TrafficAnalyzer& operator=(const TrafficAnalyzer&) = delete;

  // started_at is when work on this frame began (before detection), used for the fps figure
  AnalyticsSnapshot process(const Frame& frame,
                            const DetectionList& detections,
                            std::chrono::steady_clock::time_point started_at = std::chrono::steady_clock::now());

  // Between frames only. A changed counting line flushes all crossing history
  void apply_settings(const AnalyzerSettings& settings);

  // Between frames only. Clears counters and all tracker, line, zone and crowd state. Track ids keep increasing
  void reset();

  CounterValues counters() const;

  const ZoneAggregator& zones() const { return zones_; }
  const LineCounter& line_counter() const { return line_counter_; }
  const Tracker& tracker() const { return tracker_; }
  AnalysisMode mode() const { return mode_.mode(); }
  const AnalyzerSettings& settings() const { return settings_; }

  // Crossing events produced by the most recent process() call
  const std::vector<std::pair<int, CrossingDirection>>& last_crossings() const { return last_crossings_; }

private:
  void count_crossings(const DetectionList& tracks);
  AnalyticsSnapshot build_snapshot(std::uint64_t frame_id, const CrowdAnalysis& crowd) const;

  AnalyzerSettings settings_;

  Tracker tracker_;
  LineCounter line_counter_;
  ZoneAggregator zones_;
  CrowdDensityEstimator crowd_;
  ModeMachine mode_;

  DetectionList last_tracks_;
  std::vector<std::pair<int, CrossingDirection>> last_crossings_;

  std::atomic<int> current_count_{0};
  std::atomic<int> total_entries_{0};
  std::atomic<int> total_exits_{0};
  std::atomic<int> unique_visitors_{0};
  std::atomic<float> fps_{0.f};
};

} // namespace fta
