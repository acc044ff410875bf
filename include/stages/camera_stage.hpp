#pragma once

#include <atomic>
#include <cstdint>
#include <functional>

#include "core/config.hpp"
#include "core/frame.hpp"
#include "infra/metrics.hpp"
#include "stages/stage.hpp"

namespace fta {

// Reads frames from a camera device or a video file and offers each one to a sink. The sink decides whether to
// take it (returns false when it is busy, the frame is then counted as dropped here)
class CameraStage final : public Stage {
public:
  using FrameSink = std::function<bool(Frame)>;

  CameraStage(StageMetrics* metrics, CameraConfig cfg, FrameSink sink);

  // True once a file source has been read to the end, or the source could not be opened
  bool finished() const { return finished_.load(std::memory_order_relaxed); }

protected:
  void run(const StopToken& global_stop,
           const std::atomic_bool& local_stop) override;

private:
  StageMetrics* metrics_;
  CameraConfig cfg_;
  FrameSink sink_;
  std::uint64_t next_id_{0};
  std::atomic_bool finished_{false};
};

} // namespace fta
