#pragma once

#include "core/detections.hpp"
#include "core/frame.hpp"

namespace fta {

// Black box person detector. Returns boxes in the frame's pixel coordinates with track_id left at kNoTrackId.
// An empty list is a valid answer. Implementations may throw, the analytics stage treats that as a failed frame
class Detector {
public:
  virtual ~Detector() = default;

  virtual DetectionList detect(const Frame& frame) = 0;
};

} // namespace fta
