#pragma once

#include <cstddef>
#include <map>
#include <vector>

#include "core/detections.hpp"
#include "core/track.hpp"

/*
    Tracker associates per-frame detections with persistent tracks (two-tier, ByteTrack style).

    Association is greedy: every (track, detection) pair with 1 - IoU below match_thresh becomes a candidate, the
    candidates are stably sorted by ascending cost and accepted in that order whenever neither side is taken yet.
    Ties resolve in (track id, detection index) order. The result is deterministic but not a globally optimal
    assignment.

    Not thread-safe. One owner calls update() once per frame.
*/

namespace fta {

struct TrackerParams {
  float track_thresh{0.5f};  // Detections at or above this are high confidence
  float match_thresh{0.8f};  // Pairs are candidates only when 1 - IoU < match_thresh
  int track_buffer{30};      // A track is removed once time_since_update exceeds this
};

class Tracker {
public:
  explicit Tracker(TrackerParams params = {});

  // Advance one frame. Returns the live tracks, ascending id, as detections annotated with their track id
  DetectionList update(const DetectionList& detections);

  // Drop every track. Ids keep counting from where they were, an id is never handed out twice
  void clear();

  void set_params(const TrackerParams& params) { params_ = params; }
  const TrackerParams& params() const { return params_; }

  const std::map<int, Track>& tracks() const { return tracks_; }
  std::size_t size() const { return tracks_.size(); }

  // Ids removed by the most recent update()
  const std::vector<int>& removed_last_update() const { return removed_; }

  int next_id() const { return next_id_; }

private:
  struct Match {
    int track_id;
    std::size_t det_index;
  };

  struct Association {
    std::vector<Match> matches;
    std::vector<int> unmatched_tracks;
    std::vector<std::size_t> unmatched_dets;
  };

  Association associate(const std::vector<int>& track_ids, const DetectionList& dets) const;
  void apply_match(Track& track, const Detection& det);

  TrackerParams params_;
  std::map<int, Track> tracks_;
  std::vector<int> removed_;
  int next_id_{1};
};

} // namespace fta
