#pragma once

#include <cstddef>
#include <set>

#include <opencv2/core/types.hpp>

#include "core/detections.hpp"
#include "infra/concurrent_map.hpp"
#include "infra/ring_buffer.hpp"

namespace fta {

enum class CrossingDirection {
  None,
  Entry,
  Exit
};

const char* ToString(CrossingDirection d);

struct CountingLine {
  cv::Point2f start{0.f, 540.f};
  cv::Point2f end{1920.f, 540.f};
};

inline constexpr std::size_t kCrossingHistoryCapacity = 10;

struct TrackCrossingState {
  RingBuffer<cv::Point2f, kCrossingHistoryCapacity> centers;
  bool has_crossed{false};
  CrossingDirection direction{CrossingDirection::None};
};

/*
    LineCounter fires at most one crossing event per track id.

    A track crosses when its previous and current centers lie strictly on opposite sides of the line (a center
    exactly on the line does not count). Direction follows the camera mounting convention: moving down the image
    (y increasing) is an Exit, moving up is an Entry.

    Written by the analytics worker only. Readers on other threads may query crossing state concurrently.
*/
class LineCounter {
public:
  LineCounter() = default;
  explicit LineCounter(CountingLine line);

  // Replacing the line discards every track's history, crossings in progress are lost
  void set_line(const CountingLine& line);
  const CountingLine& line() const { return line_; }

  CrossingDirection check_crossing(int track_id, const BBox& box);

  // Forget every track not in active_ids. Returns the number of states dropped
  std::size_t remove_stale_tracks(const std::set<int>& active_ids);

  void reset();

  bool has_crossed(int track_id) const;
  std::size_t tracked_count() const { return states_.size(); }

private:
  CountingLine line_{};
  ConcurrentMap<int, TrackCrossingState> states_;
};

} // namespace fta
