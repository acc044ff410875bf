#pragma once

#include <cstdint>

namespace fta {

// Tracking: per-person identities (tracker, line counter, zone membership). Crowd: density heuristics
enum class AnalysisMode {
  Tracking,
  Crowd
};

inline const char* ToString(AnalysisMode m) {
  return (m == AnalysisMode::Crowd) ? "crowd" : "tracking";
}

/*
    Two-state mode machine. The crowd switch predicate is evaluated fresh every frame and the machine follows it
    without hysteresis: true -> Crowd, false -> Tracking.
*/
class ModeMachine {
public:
  // Feed this frame's predicate. Returns true when the mode changed
  bool update(bool crowd_predicate) {
    const AnalysisMode next = crowd_predicate ? AnalysisMode::Crowd : AnalysisMode::Tracking;
    if (next == mode_) return false;
    mode_ = next;
    ++transitions_;
    return true;
  }

  AnalysisMode mode() const { return mode_; }
  bool in_crowd_mode() const { return mode_ == AnalysisMode::Crowd; }
  std::uint64_t transitions() const { return transitions_; }

  void reset() {
    mode_ = AnalysisMode::Tracking;
    transitions_ = 0;
  }

private:
  AnalysisMode mode_{AnalysisMode::Tracking};
  std::uint64_t transitions_{0};
};

} // namespace fta
