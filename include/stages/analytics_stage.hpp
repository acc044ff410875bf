#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

#include "core/analytics_snapshot.hpp"
#include "core/detector.hpp"
#include "core/frame.hpp"
#include "core/traffic_analyzer.hpp"
#include "infra/latest_store.hpp"
#include "infra/metrics.hpp"
#include "stages/stage.hpp"

/*
    AnalyticsStage is the single serialized worker of the pipeline.

    Backpressure is a busy flag, not a queue: try_submit() atomically claims the flag and hands the frame to the
    worker, or returns false straight away if a frame is already in flight. The flag is released only after the
    worker has finished (or failed) that frame, so at most one frame is ever between submission and snapshot.

    Reset and reconfiguration requests are recorded and applied by the worker itself before it picks up the next
    frame, never in the middle of one.

    A frame whose detection or analysis throws is logged and skipped, the next frame proceeds normally.
*/

namespace fta {

class AnalyticsStage final : public Stage {
public:
  AnalyticsStage(StageMetrics* metrics,
                 std::shared_ptr<Detector> detector,
                 std::shared_ptr<TrafficAnalyzer> analyzer,
                 std::shared_ptr<LatestStore<AnalyticsSnapshot>> snapshots);

  // Returns false (frame dropped) if a previous frame is still being processed
  bool try_submit(Frame frame);

  void request_reset();
  void request_settings(AnalyzerSettings settings);

  bool busy() const { return busy_.load(std::memory_order_acquire); }

  std::uint64_t processed_total() const { return processed_.load(std::memory_order_relaxed); }
  std::uint64_t dropped_total() const { return dropped_.load(std::memory_order_relaxed); }
  std::uint64_t failed_total() const { return failed_.load(std::memory_order_relaxed); }

protected:
  void run(const StopToken& global_stop,
           const std::atomic_bool& local_stop) override;

private:
  void apply_pending_control();
  void process(const Frame& frame);

  StageMetrics* metrics_;
  std::shared_ptr<Detector> detector_;
  std::shared_ptr<TrafficAnalyzer> analyzer_;
  std::shared_ptr<LatestStore<AnalyticsSnapshot>> snapshots_;

  std::atomic_bool busy_{false};

  std::mutex mu_;
  std::condition_variable cv_;
  std::optional<Frame> pending_frame_;
  std::optional<AnalyzerSettings> pending_settings_;
  bool reset_requested_{false};

  std::atomic<std::uint64_t> processed_{0};
  std::atomic<std::uint64_t> dropped_{0};
  std::atomic<std::uint64_t> failed_{0};
};

} // namespace fta
