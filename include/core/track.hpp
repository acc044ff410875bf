#pragma once

#include <cstddef>

#include "core/detections.hpp"
#include "core/motion_model.hpp"
#include "infra/ring_buffer.hpp"

namespace fta {

inline constexpr std::size_t kTrackHistoryCapacity = 30;

// New: created this frame, never matched since. Tracked: matched this frame. Lost: missed at least the last frame.
// Removed is terminal and never observable on a live Track, the tracker drops it from its set.
enum class TrackState {
  New,
  Tracked,
  Lost
};

struct Track {
  int id{kNoTrackId};
  BBox bbox;
  float confidence{0.f};

  int age{0};                // Frames successfully matched
  int time_since_update{0};  // Frames since the last match

  MotionModel motion;
  RingBuffer<BBox, kTrackHistoryCapacity> history;

  TrackState state() const {
    if (time_since_update > 0) return TrackState::Lost;
    return (age == 0) ? TrackState::New : TrackState::Tracked;
  }

  Detection as_detection() const {
    Detection d;
    d.bbox = bbox;
    d.confidence = confidence;
    d.class_id = kPersonClassId;
    d.track_id = id;
    return d;
  }
};

const char* ToString(TrackState s);

} // namespace fta
