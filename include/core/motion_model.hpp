#pragma once

#include "core/detections.hpp"

/*
    MotionModel is the per-track constant-velocity predictor.

    It is NOT a Kalman filter: there is no covariance and no gain. predict() moves the center by the current velocity,
    correct() snaps the position and size to the measurement and blends the velocity 50/50 with the observed
    displacement. The model reacts to a measurement in one frame instead of smoothing noise over several.
*/

namespace fta {

class MotionModel {
public:
  MotionModel() = default;

  // Reset state to the given box with zero velocity
  void initiate(const BBox& box);

  // Advance the center by the velocity, size unchanged. Returns the predicted box
  BBox predict();

  // v' = 0.5 * v + 0.5 * (measured center - prior center), then position and size jump to the measurement
  void correct(const BBox& measurement);

  BBox box() const { return BBox::FromCenter(cx_, cy_, w_, h_); }

  float cx() const { return cx_; }
  float cy() const { return cy_; }
  float vx() const { return vx_; }
  float vy() const { return vy_; }
  float width() const { return w_; }
  float height() const { return h_; }

private:
  float cx_{0.f};
  float cy_{0.f};
  float w_{0.f};
  float h_{0.f};
  float vx_{0.f};
  float vy_{0.f};
};

} // namespace fta
