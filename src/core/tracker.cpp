#include "core/tracker.hpp"

#include <algorithm>

#include "core/geometry.hpp"

namespace fta {

const char* ToString(TrackState s) {
  switch (s) {
    case TrackState::New: return "new";
    case TrackState::Tracked: return "tracked";
    case TrackState::Lost: return "lost";
  }
  return "unknown";
}

Tracker::Tracker(TrackerParams params) : params_(params) {}

Tracker::Association Tracker::associate(const std::vector<int>& track_ids, const DetectionList& dets) const {
  Association out;

  if (track_ids.empty() || dets.empty()) {
    out.unmatched_tracks = track_ids;
    for (std::size_t j = 0; j < dets.size(); ++j) out.unmatched_dets.push_back(j);
    return out;
  }

  struct Candidate {
    std::size_t ti;
    std::size_t dj;
    float cost;
  };

  std::vector<Candidate> cands;
  cands.reserve(track_ids.size() * dets.size());
  for (std::size_t i = 0; i < track_ids.size(); ++i) {
    const BBox& tb = tracks_.at(track_ids[i]).bbox;
    for (std::size_t j = 0; j < dets.size(); ++j) {
      const float cost = 1.f - IoU(tb, dets[j].bbox);
      if (cost < params_.match_thresh) cands.push_back({i, j, cost});
    }
  }

  std::stable_sort(cands.begin(), cands.end(),
                   [](const Candidate& a, const Candidate& b) { return a.cost < b.cost; });

  std::vector<bool> track_used(track_ids.size(), false);
  std::vector<bool> det_used(dets.size(), false);

  for (const auto& c : cands) {
    if (track_used[c.ti] || det_used[c.dj]) continue;
    track_used[c.ti] = true;
    det_used[c.dj] = true;
    out.matches.push_back({track_ids[c.ti], c.dj});
  }

  for (std::size_t i = 0; i < track_ids.size(); ++i) {
    if (!track_used[i]) out.unmatched_tracks.push_back(track_ids[i]);
  }
  for (std::size_t j = 0; j < dets.size(); ++j) {
    if (!det_used[j]) out.unmatched_dets.push_back(j);
  }
  return out;
}

void Tracker::apply_match(Track& track, const Detection& det) {
  track.motion.correct(det.bbox);
  track.bbox = det.bbox;
  track.confidence = det.confidence;
  track.time_since_update = 0;
  ++track.age;
  track.history.push(det.bbox);
}

DetectionList Tracker::update(const DetectionList& detections) {
  removed_.clear();

  // 1. Predict every live track
  std::vector<int> live_ids;
  live_ids.reserve(tracks_.size());
  for (auto& kv : tracks_) {
    Track& t = kv.second;
    t.bbox = t.motion.predict();
    ++t.time_since_update;
    live_ids.push_back(kv.first);
  }

  // 2. Split by confidence
  DetectionList high;
  DetectionList low;
  for (const auto& d : detections) {
    if (d.confidence >= params_.track_thresh) {
      high.push_back(d);
    } else {
      low.push_back(d);
    }
  }

  // 3-4. First pass against high confidence detections
  const Association first = associate(live_ids, high);
  for (const auto& m : first.matches) apply_match(tracks_.at(m.track_id), high[m.det_index]);

  // 5. Second pass, leftover tracks against low confidence detections
  if (!low.empty() && !first.unmatched_tracks.empty()) {
    const Association second = associate(first.unmatched_tracks, low);
    for (const auto& m : second.matches) apply_match(tracks_.at(m.track_id), low[m.det_index]);
  }

  // 6. Unmatched high confidence detections start new tracks
  for (const std::size_t j : first.unmatched_dets) {
    const Detection& d = high[j];
    Track t;
    t.id = next_id_++;
    t.bbox = d.bbox;
    t.confidence = d.confidence;
    t.motion.initiate(d.bbox);
    t.history.push(d.bbox);
    tracks_.emplace(t.id, std::move(t));
  }

  // 7. Retire tracks that have been missing for longer than the buffer
  for (auto it = tracks_.begin(); it != tracks_.end();) {
    if (it->second.time_since_update > params_.track_buffer) {
      removed_.push_back(it->first);
      it = tracks_.erase(it);
    } else {
      ++it;
    }
  }

  // 8. Live set, ascending id
  DetectionList out;
  out.reserve(tracks_.size());
  for (const auto& kv : tracks_) out.push_back(kv.second.as_detection());
  return out;
}

void Tracker::clear() {
  tracks_.clear();
  removed_.clear();
}

} // namespace fta
