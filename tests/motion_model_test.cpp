#include "check.hpp"
#include "core/motion_model.hpp"

static void InitiateHasZeroVelocity() {
  fta::MotionModel m;
  m.initiate(fta::BBox{0.f, 0.f, 10.f, 20.f});

  FTA_CHECK_NEAR(m.cx(), 5.f, 1e-5);
  FTA_CHECK_NEAR(m.cy(), 10.f, 1e-5);
  FTA_CHECK_NEAR(m.width(), 10.f, 1e-5);
  FTA_CHECK_NEAR(m.height(), 20.f, 1e-5);
  FTA_CHECK_NEAR(m.vx(), 0.f, 1e-6);
  FTA_CHECK_NEAR(m.vy(), 0.f, 1e-6);

  const fta::BBox p = m.predict();
  FTA_CHECK_NEAR(p.left, 0.f, 1e-5);
  FTA_CHECK_NEAR(p.bottom, 20.f, 1e-5);
}

static void CorrectBlendsVelocity() {
  fta::MotionModel m;
  m.initiate(fta::BBox{0.f, 0.f, 10.f, 20.f});  // center (5, 10)

  // Measured center (9, 10), size 12x22
  m.correct(fta::BBox::FromCenter(9.f, 10.f, 12.f, 22.f));
  FTA_CHECK_NEAR(m.vx(), 2.f, 1e-5);
  FTA_CHECK_NEAR(m.vy(), 0.f, 1e-5);
  FTA_CHECK_NEAR(m.cx(), 9.f, 1e-5);
  FTA_CHECK_NEAR(m.width(), 12.f, 1e-5);
  FTA_CHECK_NEAR(m.height(), 22.f, 1e-5);

  // Prediction moves the center, keeps the size
  const fta::BBox p = m.predict();
  FTA_CHECK_NEAR(p.center_x(), 11.f, 1e-5);
  FTA_CHECK_NEAR(p.width(), 12.f, 1e-5);

  // Displacement is measured against the predicted center
  m.correct(fta::BBox::FromCenter(15.f, 14.f, 12.f, 22.f));
  FTA_CHECK_NEAR(m.vx(), 3.f, 1e-5);
  FTA_CHECK_NEAR(m.vy(), 2.f, 1e-5);
  FTA_CHECK_NEAR(m.cy(), 14.f, 1e-5);
}

static void ReinitiateClearsVelocity() {
  fta::MotionModel m;
  m.initiate(fta::BBox{0.f, 0.f, 10.f, 10.f});
  m.correct(fta::BBox{10.f, 10.f, 20.f, 20.f});
  FTA_CHECK(m.vx() > 0.f);

  m.initiate(fta::BBox{100.f, 100.f, 110.f, 110.f});
  FTA_CHECK_NEAR(m.vx(), 0.f, 1e-6);
  FTA_CHECK_NEAR(m.box().left, 100.f, 1e-5);
}

int main() {
  InitiateHasZeroVelocity();
  CorrectBlendsVelocity();
  ReinitiateClearsVelocity();
  return fta::test::Finish("motion_model_test");
}
