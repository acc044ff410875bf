#include "core/motion_model.hpp"

namespace fta {

static constexpr float kVelocityBlend = 0.5f;

void MotionModel::initiate(const BBox& box) {
  cx_ = box.center_x();
  cy_ = box.center_y();
  w_ = box.width();
  h_ = box.height();
  vx_ = 0.f;
  vy_ = 0.f;
}

BBox MotionModel::predict() {
  cx_ += vx_;
  cy_ += vy_;
  return box();
}

void MotionModel::correct(const BBox& measurement) {
  const float mcx = measurement.center_x();
  const float mcy = measurement.center_y();

  vx_ = kVelocityBlend * vx_ + (1.f - kVelocityBlend) * (mcx - cx_);
  vy_ = kVelocityBlend * vy_ + (1.f - kVelocityBlend) * (mcy - cy_);

  cx_ = mcx;
  cy_ = mcy;
  w_ = measurement.width();
  h_ = measurement.height();
}

} // namespace fta
