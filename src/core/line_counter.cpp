#include "core/line_counter.hpp"

#include "core/geometry.hpp"

namespace fta {

const char* ToString(CrossingDirection d) {
  switch (d) {
    case CrossingDirection::None: return "none";
    case CrossingDirection::Entry: return "entry";
    case CrossingDirection::Exit: return "exit";
  }
  return "unknown";
}

LineCounter::LineCounter(CountingLine line) : line_(line) {}

void LineCounter::set_line(const CountingLine& line) {
  line_ = line;
  reset();
}

CrossingDirection LineCounter::check_crossing(int track_id, const BBox& box) {
  const cv::Point2f center = box.center();
  const CountingLine line = line_;

  return states_.update(track_id, [&](TrackCrossingState& st) {
    st.centers.push(center);

    if (st.centers.size() < 2 || st.has_crossed) return CrossingDirection::None;

    const cv::Point2f& prev = st.centers.previous();
    const cv::Point2f& curr = st.centers.back();

    const float s1 = LineSide(line.start, line.end, prev);
    const float s2 = LineSide(line.start, line.end, curr);
    if (!(s1 * s2 < 0.f)) return CrossingDirection::None;

    st.has_crossed = true;
    st.direction = (curr.y > prev.y) ? CrossingDirection::Exit : CrossingDirection::Entry;
    return st.direction;
  });
}

std::size_t LineCounter::remove_stale_tracks(const std::set<int>& active_ids) {
  return states_.erase_if([&](const int id, const TrackCrossingState&) {
    return active_ids.find(id) == active_ids.end();
  });
}

void LineCounter::reset() {
  states_.clear();
}

bool LineCounter::has_crossed(int track_id) const {
  const auto st = states_.get(track_id);
  return st && st->has_crossed;
}

} // namespace fta
