#include <set>

#include "check.hpp"
#include "core/line_counter.hpp"

static fta::BBox At(float cx, float cy) { return fta::BBox::FromCenter(cx, cy, 20.f, 40.f); }

static void DownwardIsOneExit() {
  fta::LineCounter counter;  // y = 540 across a 1080p frame

  FTA_CHECK(counter.check_crossing(1, At(100.f, 530.f)) == fta::CrossingDirection::None);
  FTA_CHECK(counter.check_crossing(1, At(100.f, 550.f)) == fta::CrossingDirection::Exit);
  FTA_CHECK(counter.has_crossed(1));

  // Never again for this id, in either direction
  FTA_CHECK(counter.check_crossing(1, At(100.f, 570.f)) == fta::CrossingDirection::None);
  FTA_CHECK(counter.check_crossing(1, At(100.f, 500.f)) == fta::CrossingDirection::None);
  FTA_CHECK(counter.tracked_count() == 1);
}

static void UpwardIsEntry() {
  fta::LineCounter counter;
  counter.check_crossing(7, At(200.f, 560.f));
  FTA_CHECK(counter.check_crossing(7, At(200.f, 520.f)) == fta::CrossingDirection::Entry);
  FTA_CHECK(!counter.has_crossed(8));
}

static void TouchingTheLineIsNotACrossing() {
  fta::LineCounter counter;
  counter.check_crossing(3, At(100.f, 540.f));
  FTA_CHECK(counter.check_crossing(3, At(100.f, 560.f)) == fta::CrossingDirection::None);
  FTA_CHECK(!counter.has_crossed(3));

  // The next strict sign change still counts
  FTA_CHECK(counter.check_crossing(3, At(100.f, 520.f)) == fta::CrossingDirection::Entry);
}

static void DirectionFollowsImageY() {
  // Diagonal line, the path crosses it moving down and to the left
  fta::CountingLine diagonal;
  diagonal.start = {0.f, 0.f};
  diagonal.end = {100.f, 100.f};
  fta::LineCounter counter(diagonal);

  counter.check_crossing(1, At(60.f, 40.f));
  FTA_CHECK(counter.check_crossing(1, At(40.f, 60.f)) == fta::CrossingDirection::Exit);
}

static void SetLineDropsHistory() {
  fta::LineCounter counter;
  counter.check_crossing(1, At(100.f, 530.f));
  counter.check_crossing(1, At(100.f, 550.f));
  FTA_CHECK(counter.has_crossed(1));

  fta::CountingLine vertical;
  vertical.start = {960.f, 0.f};
  vertical.end = {960.f, 1080.f};
  counter.set_line(vertical);

  FTA_CHECK(!counter.has_crossed(1));
  FTA_CHECK(counter.tracked_count() == 0);
  FTA_CHECK(counter.line().start.x == 960.f);

  // One sample after the swap is not enough to cross
  FTA_CHECK(counter.check_crossing(1, At(950.f, 550.f)) == fta::CrossingDirection::None);
  FTA_CHECK(counter.check_crossing(1, At(970.f, 560.f)) == fta::CrossingDirection::Exit);
}

static void StaleTracksArePruned() {
  fta::LineCounter counter;
  for (int id = 1; id <= 4; ++id) counter.check_crossing(id, At(100.f * id, 300.f));
  FTA_CHECK(counter.tracked_count() == 4);

  const auto dropped = counter.remove_stale_tracks(std::set<int>{2, 4});
  FTA_CHECK(dropped == 2);
  FTA_CHECK(counter.tracked_count() == 2);

  counter.reset();
  FTA_CHECK(counter.tracked_count() == 0);
}

static void HistoryStaysBounded() {
  fta::LineCounter counter;
  for (int i = 0; i < 50; ++i) counter.check_crossing(1, At(100.f, 100.f + i));
  FTA_CHECK(!counter.has_crossed(1));
  FTA_CHECK(counter.tracked_count() == 1);
}

int main() {
  DownwardIsOneExit();
  UpwardIsEntry();
  TouchingTheLineIsNotACrossing();
  DirectionFollowsImageY();
  SetLineDropsHistory();
  StaleTracksArePruned();
  HistoryStaysBounded();
  return fta::test::Finish("line_counter_test");
}
